#pragma once

#include "di/container/string/string.h"
#include "di/reflect/prelude.h"
#include "di/types/prelude.h"
#include "di/vocab/span/prelude.h"

namespace vtcore {
/// @brief How bytes from the host are turned into code points
enum class InputEncoding {
    Utf8,     ///< UTF-8, with C1 controls only reachable through their 2 byte encoding
    EightBit, ///< Every byte is a code point (ISO 8859-1), so 0x80-0x9F are C1 controls
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<InputEncoding>) {
    using enum InputEncoding;
    return di::make_enumerators<"InputEncoding">(di::enumerator<"utf8", Utf8>, di::enumerator<"8bit", EightBit>);
}

/// @brief Incremental decoder for the host byte stream
///
/// In UTF-8 mode a code point split across two reads is buffered until the
/// rest of it arrives. Invalid sequences become U+FFFD using the "maximal
/// subpart" rule from the Unicode core specification.
class InputDecoder {
public:
    constexpr static auto replacement_character = U'\uFFFD';

    InputDecoder() = default;
    constexpr explicit InputDecoder(InputEncoding encoding) : m_encoding(encoding) {}

    auto encoding() const -> InputEncoding { return m_encoding; }

    auto decode(di::Span<byte const> input) -> di::String;

    // Flush any pending data. If a partial code point is pending, a single
    // replacement character is output.
    auto flush() -> di::String;

private:
    constexpr static auto default_lower_bound = u8(0x80);
    constexpr static auto default_upper_bound = u8(0xBF);

    void decode_byte(di::String& output, byte input);
    void decode_first_byte(di::String& output, byte input);
    void output_code_point(di::String& output, c32 code_point);
    void reset_pending();

    InputEncoding m_encoding { InputEncoding::Utf8 };
    u8 m_pending_code_units { 0 };
    u32 m_pending_code_point { 0 };
    u8 m_lower_bound { default_lower_bound };
    u8 m_upper_bound { default_upper_bound };
};
}
