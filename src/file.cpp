/**
 * @file file.cpp
 * @brief Loading and saving RIFL files by path.
 */

#include <rawrfid/file.hpp>
#include <rawrfid/bytebuffer.hpp>

#include <filesystem>
#include <fstream>
#include <utility>

namespace rawrfid {

Error read_file(const std::string& path, std::vector<std::uint8_t>& bytes) {
    // Directories open fine as streams and report a bogus size
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Error::Io;
    }

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return Error::Io;
    }

    std::streamsize size = file.tellg();
    if (size < 0) {
        return Error::Io;
    }
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        return Error::Io;
    }

    bytes = std::move(buffer);
    return Error::Ok;
}

Error write_file(const std::string& path, const std::uint8_t* data, std::size_t size) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return Error::Io;
    }
    file.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    file.flush();
    return file.good() ? Error::Ok : Error::Io;
}

Error load(const std::string& path, Container& out, const DecodeParams* params,
           std::size_t* error_offset) {
    std::vector<std::uint8_t> bytes;
    Error result = read_file(path, bytes);
    if (result != Error::Ok) {
        return result;
    }
    return decode(bytes.data(), bytes.size(), out, params, error_offset);
}

Error save(const std::string& path, const Container& container) {
    ByteBuffer encoded;
    Error result = encode(container, encoded);
    if (result != Error::Ok) {
        return result;
    }
    return write_file(path, encoded.data(), encoded.size());
}

} // namespace rawrfid
