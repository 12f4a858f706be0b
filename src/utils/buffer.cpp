#include "mctrl/utils/buffer.hpp"

namespace mctrl::utils {

bool isValidUtf8(const uint8_t* data, size_t size) {
    size_t i = 0;
    while (i < size) {
        uint8_t lead = data[i];

        if (lead < 0x80) {
            i++;
            continue;
        }

        size_t length;
        uint32_t codepoint;
        uint32_t minimum;

        if ((lead & 0xE0) == 0xC0) {
            length = 2;
            codepoint = lead & 0x1F;
            minimum = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            codepoint = lead & 0x0F;
            minimum = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            codepoint = lead & 0x07;
            minimum = 0x10000;
        } else {
            return false;
        }

        if (i + length > size) {
            return false;
        }

        for (size_t k = 1; k < length; k++) {
            uint8_t cont = data[i + k];
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            codepoint = (codepoint << 6) | (cont & 0x3F);
        }

        if (codepoint < minimum || codepoint > 0x10FFFF ||
            (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
            return false;
        }

        i += length;
    }

    return true;
}

} // namespace mctrl::utils
