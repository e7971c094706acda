#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

typedef struct magic_set* magic_t;

namespace ts::util {

class Magic {
public:
    Magic();
    ~Magic();

    Magic(const Magic&) = delete;
    Magic& operator=(const Magic&) = delete;

    [[nodiscard]] std::string mime_type_buffer(const std::vector<uint8_t>& buffer) const;

    static std::string get_mime_type_from_buffer(const std::vector<uint8_t>& buffer);

private:
    magic_t cookie;
};

// Extension table first (libmagic reports markdown and json as text/plain),
// then content sniffing, then application/octet-stream.
std::string inferMimeType(std::string_view path, const std::vector<uint8_t>& content);

}
