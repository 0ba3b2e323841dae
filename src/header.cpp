/**
 * @file header.cpp
 * @brief RIFL header decoding and encoding.
 */

#include <rawrfid/header.hpp>

#include <cmath>

namespace rawrfid {

static_assert(FIELD_MAGIC.width == sizeof(std::uint32_t) &&
                  FIELD_VERSION.width == sizeof(std::uint32_t) &&
                  FIELD_FREQUENCY.width == sizeof(float) &&
                  FIELD_DUTY_CYCLE.width == sizeof(float) &&
                  FIELD_MAX_BUFFER_SIZE.width == sizeof(std::uint32_t),
              "field widths must match the loaded types");

Error validate_header(const Header& header) noexcept {
    if (header.version != RIFL_VERSION) {
        return Error::UnsupportedVersion;
    }
    if (!std::isfinite(header.frequency) || header.frequency <= 0.0F) {
        return Error::InvalidHeader;
    }
    // Negated comparison also rejects NaN
    if (!(header.duty_cycle >= 0.0F && header.duty_cycle <= 1.0F)) {
        return Error::InvalidHeader;
    }
    return Error::Ok;
}

Error decode_header(const std::uint8_t* data, std::size_t size, Header& header) noexcept {
    if (data == nullptr || size < HEADER_SIZE) {
        return Error::TruncatedInput;
    }

    if (load_u32_le(data + FIELD_MAGIC.offset) != RIFL_MAGIC) {
        return Error::BadMagic;
    }

    Header decoded;
    decoded.version = load_u32_le(data + FIELD_VERSION.offset);
    decoded.frequency = load_f32_le(data + FIELD_FREQUENCY.offset);
    decoded.duty_cycle = load_f32_le(data + FIELD_DUTY_CYCLE.offset);
    decoded.max_buffer_size = load_u32_le(data + FIELD_MAX_BUFFER_SIZE.offset);

    Error result = validate_header(decoded);
    if (result != Error::Ok) {
        return result;
    }

    header = decoded;
    return Error::Ok;
}

void encode_header(ByteBuffer& output, const Header& header) {
    output.append_u32_le(RIFL_MAGIC);
    output.append_u32_le(header.version);
    output.append_f32_le(header.frequency);
    output.append_f32_le(header.duty_cycle);
    output.append_u32_le(header.max_buffer_size);
}

} // namespace rawrfid
