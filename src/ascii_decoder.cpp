#include "plyr/decoder.hpp"
#include "plyr/grammar.hpp"
#include "ply_internal.hpp"

#include <charconv>
#include <cstdint>
#include <system_error>
#include <type_traits>
#include <vector>

namespace plyr::detail {

// True when the decimal text `tok` (already accepted by from_chars) has a
// magnitude below 1, i.e. an out-of-range result is an underflow.
static bool decimal_below_one(std::string_view tok) {
    std::size_t i = 0;
    if (i < tok.size() && (tok[i] == '-' || tok[i] == '+')) ++i;

    // Decimal exponent of the leading significant digit.
    std::int64_t lead = 0;
    bool found = false;
    std::int64_t int_digits = 0;
    for (; i < tok.size() && tok[i] >= '0' && tok[i] <= '9'; ++i) {
        if (found || tok[i] != '0') {
            found = true;
            ++int_digits;
        }
    }
    if (found) {
        lead = int_digits - 1;
    } else if (i < tok.size() && tok[i] == '.') {
        ++i;
        std::int64_t zeros = 0;
        for (; i < tok.size() && tok[i] == '0'; ++i) ++zeros;
        if (i < tok.size() && tok[i] >= '1' && tok[i] <= '9') {
            found = true;
            lead = -(zeros + 1);
        }
    }
    if (!found) return true; // zero

    while (i < tok.size() && tok[i] != 'e' && tok[i] != 'E') ++i;
    std::int64_t exp = 0;
    if (i < tok.size()) {
        ++i;
        bool neg = false;
        if (i < tok.size() && (tok[i] == '-' || tok[i] == '+')) neg = tok[i++] == '-';
        for (; i < tok.size() && tok[i] >= '0' && tok[i] <= '9'; ++i) {
            if (exp < 100000) exp = exp * 10 + (tok[i] - '0');
        }
        if (neg) exp = -exp;
    }
    return lead + exp < 0;
}

// Locale-independent; the whole token must be consumed and fit in T. Floating
// values too small for T round to a signed zero.
template <typename T>
static bool parse_number(std::string_view tok, T& out) {
    if (!tok.empty() && tok.front() == '+') {
        tok.remove_prefix(1);
        if (!tok.empty() && (tok.front() == '+' || tok.front() == '-')) return false;
    }
    if (tok.empty()) return false;

    const char* first = tok.data();
    const char* last = first + tok.size();
    std::from_chars_result r{};
    if constexpr (std::is_floating_point_v<T>) {
        r = std::from_chars(first, last, out, std::chars_format::general);
        if (r.ec == std::errc::result_out_of_range && r.ptr == last && decimal_below_one(tok)) {
            // Some libraries flag subnormal results too; keep them when a wider type holds the value.
            long double wide = 0;
            const auto w = std::from_chars(first, last, wide, std::chars_format::general);
            out = w.ec == std::errc() && w.ptr == last ? static_cast<T>(wide)
                                                      : (tok.front() == '-' ? -T(0) : T(0));
            return true;
        }
    } else {
        r = std::from_chars(first, last, out, 10);
    }
    return r.ec == std::errc() && r.ptr == last;
}

namespace {

class RecordTokens {
public:
    RecordTokens(std::string_view line, const ElementDef& element, const LocationTracker& location)
        : tokens_(grammar::data_line(line)),
          text_(grammar::trim_line(line)),
          element_(element),
          location_(location) {}

    std::size_t remaining() const { return tokens_.size() - pos_; }

    std::string_view next(const PropertyDef& p) {
        if (pos_ >= tokens_.size()) throw error(p, "missing value");
        return tokens_[pos_++];
    }

    template <typename T>
    T next_as(const PropertyDef& p, ScalarType t) {
        std::string_view tok = next(p);
        T v{};
        if (!parse_number(tok, v)) {
            throw error(p, "cannot parse '" + std::string(tok) + "' as " + to_string(t));
        }
        return v;
    }

    ScalarValue next_scalar(const PropertyDef& p, ScalarType t) {
        return internal::with_scalar_type(t, [&](auto tag) -> ScalarValue {
            using T = typename decltype(tag)::type;
            return ScalarValue{next_as<T>(p, t)};
        });
    }

    PlyError error(const PropertyDef& p, const std::string& what) const {
        return PlyError(ErrorKind::MalformedRecord,
                        "element '" + element_.name + "', property '" + p.name + "': " + what,
                        location_.line_index, std::string(text_));
    }

    PlyError trailing_error() const {
        return PlyError(ErrorKind::MalformedRecord,
                        "element '" + element_.name + "': unexpected trailing token '" +
                        std::string(tokens_[pos_]) + "'",
                        location_.line_index, std::string(text_));
    }

private:
    std::vector<std::string_view> tokens_;
    std::string_view text_;
    std::size_t pos_{0};
    const ElementDef& element_;
    const LocationTracker& location_;
};

} // namespace

void read_ascii_record(
    std::string_view line,
    const ElementDef& element,
    const ReadOptions& opts,
    const LocationTracker& location,
    PropertyAccess& out
) {
    RecordTokens tokens(line, element, location);

    for (const auto& kv : element.properties) {
        const PropertyDef& p = kv.second;

        if (const auto* st = std::get_if<ScalarType>(&p.type)) {
            out.set_scalar(p.name, tokens.next_scalar(p, *st));
            continue;
        }

        const auto& lt = std::get<ListType>(p.type);
        const auto n = internal::list_count(tokens.next_scalar(p, lt.index_type));
        if (!n) throw tokens.error(p, "list length is not a non-negative integer");
        if (*n > tokens.remaining()) {
            throw tokens.error(p, "list declares " + std::to_string(*n) + " values but only " +
                                  std::to_string(tokens.remaining()) + " remain");
        }

        ListValue values = internal::with_scalar_type(lt.value_type, [&](auto tag) -> ListValue {
            using T = typename decltype(tag)::type;
            std::vector<T> v;
            v.reserve(static_cast<std::size_t>(*n));
            for (std::uint64_t i = 0; i < *n; ++i) {
                v.push_back(tokens.next_as<T>(p, lt.value_type));
            }
            return ListValue{std::move(v)};
        });
        out.set_list(p.name, std::move(values));
    }

    if (opts.trailing_tokens == TrailingTokens::Reject && tokens.remaining() > 0) {
        throw tokens.trailing_error();
    }
}

} // namespace plyr::detail
