#ifndef __UEX_UTF8_DECODER__
#define __UEX_UTF8_DECODER__

#include "Headers.hpp"

namespace uex {
/**
 * @brief Incremental UTF-8 decoder for terminal output.
 *
 * A multi-byte sequence split across two `decode()` calls is held back until
 * it is complete. Bytes that can never form valid UTF-8 are rendered as
 * `\xNN` escapes instead of failing, so the output is always valid UTF-8.
 */
class Utf8Decoder {
 public:
  Utf8Decoder() {}

  /**
   * @brief Decodes the next chunk of raw bytes.
   * @return Validated text; may be empty if the chunk only started a
   * sequence.
   */
  string decode(const char* data, size_t count);

  string decode(const string& data) { return decode(data.data(), data.size()); }

  /**
   * @brief Escapes and returns any bytes still held back from an incomplete
   * sequence.
   */
  string flush();

  /** @brief Number of bytes held back waiting for the rest of a sequence. */
  size_t pending() const { return tail.size(); }

  static string escapeByte(unsigned char c);

 protected:
  string tail;
};
}  // namespace uex

#endif  // __UEX_UTF8_DECODER__
