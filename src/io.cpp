#include "plyr/decoder.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>

#include <zlib.h>

namespace plyr::detail {

static constexpr std::uint64_t kMaxInflatedSize = 16ull * 1024ull * 1024ull * 1024ull; // 16 GiB

static bool has_gzip_magic(std::istream& is) {
    std::array<unsigned char, 2> b{};
    is.read(reinterpret_cast<char*>(b.data()), 2);
    const bool gz = is.gcount() == 2 && b[0] == 0x1f && b[1] == 0x8b;
    is.clear();
    is.seekg(0, std::ios::beg);
    if (!is) throw PlyError(ErrorKind::Io, "seek failed while probing for gzip input");
    return gz;
}

// Inflate a gzip stream (possibly several concatenated members).
static std::string gunzip(const std::string& in) {
    z_stream zs{};
    if (::inflateInit2(&zs, 16 + MAX_WBITS) != Z_OK) {
        throw PlyError(ErrorKind::ZlibError, "zlib inflateInit2 failed");
    }

    // avail_in is a uInt, so large inputs are fed in slices.
    const char* next = in.data();
    std::size_t left = in.size();
    auto refill = [&] {
        const std::size_t n = std::min<std::size_t>(left, std::numeric_limits<uInt>::max());
        zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(next));
        zs.avail_in = static_cast<uInt>(n);
        next += n;
        left -= n;
    };
    refill();

    std::string out;
    std::array<char, 64 * 1024> chunk{};
    int rc = Z_OK;
    for (;;) {
        if (zs.avail_in == 0 && left > 0) refill();
        zs.next_out = reinterpret_cast<Bytef*>(chunk.data());
        zs.avail_out = static_cast<uInt>(chunk.size());
        rc = ::inflate(&zs, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            std::string msg = zs.msg ? zs.msg : "inflate failed";
            ::inflateEnd(&zs);
            throw PlyError(ErrorKind::ZlibError, "zlib: " + msg);
        }
        out.append(chunk.data(), chunk.size() - zs.avail_out);
        if (out.size() > kMaxInflatedSize) {
            ::inflateEnd(&zs);
            throw PlyError(ErrorKind::ZlibError, "inflated size exceeds configured limit");
        }
        if (rc == Z_STREAM_END) {
            if (zs.avail_in == 0 && left == 0) break;
            if (::inflateReset(&zs) != Z_OK) {
                ::inflateEnd(&zs);
                throw PlyError(ErrorKind::ZlibError, "zlib inflateReset failed");
            }
        }
    }
    ::inflateEnd(&zs);
    return out;
}

std::unique_ptr<std::istream> open_input(const std::filesystem::path& file, const ReadOptions& opts) {
    auto fs = std::make_unique<std::ifstream>(file, std::ios::binary);
    if (!*fs) {
        throw PlyError(ErrorKind::Io, "failed to open file: " + file.string());
    }
    if (!opts.decompress || !has_gzip_magic(*fs)) {
        return fs;
    }

    std::string compressed((std::istreambuf_iterator<char>(*fs)), std::istreambuf_iterator<char>());
    if (fs->bad()) throw PlyError(ErrorKind::Io, "failed reading file: " + file.string());
    return std::make_unique<std::istringstream>(gunzip(compressed), std::ios::in | std::ios::binary);
}

} // namespace plyr::detail
