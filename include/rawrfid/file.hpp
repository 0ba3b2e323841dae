/**
 * @file file.hpp
 * @brief Loading and saving RIFL files by path.
 */

#ifndef RAWRFID_FILE_HPP
#define RAWRFID_FILE_HPP

#include <string>
#include <vector>

#include "container.hpp"
#include "error.hpp"

namespace rawrfid {

/**
 * @brief Read a whole file into memory.
 *
 * @param path File path
 * @param[out] bytes File contents, untouched on failure
 * @return Error::Ok, or Error::Io if the path is not a regular file or
 *         cannot be read
 */
Error read_file(const std::string& path, std::vector<std::uint8_t>& bytes);

/**
 * @brief Write bytes to a file, replacing its contents.
 *
 * @return Error::Ok, or Error::Io on failure
 */
Error write_file(const std::string& path, const std::uint8_t* data, std::size_t size);

/**
 * @brief Read and decode a RIFL file.
 *
 * @param path File path (xyz.ask.raw / xyz.psk.raw)
 * @param[out] out Decoded container
 * @param params Decoder options, nullptr for defaults
 * @param[out] error_offset Byte offset of a format error, see decode()
 * @return Error::Ok, Error::Io, or any error of decode()
 */
Error load(const std::string& path, Container& out, const DecodeParams* params = nullptr,
           std::size_t* error_offset = nullptr);

/**
 * @brief Encode a container and write it to a file.
 *
 * @return Error::Ok, Error::Io, or any error of encode()
 */
Error save(const std::string& path, const Container& container);

} // namespace rawrfid

#endif // RAWRFID_FILE_HPP
