#include "attach_protocol.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <algorithm>

std::string build_attach_hello(int cols, int rows) {
    return fmt::format("{} {} {}\n", ATTACH_HELLO, cols, rows);
}

bool parse_attach_hello(const std::string& line, int& cols, int& rows) {
    auto fields = split_ws(line);
    if (fields.size() != 3 || fields[0] != ATTACH_HELLO) return false;
    int c = safe_stoi(fields[1], -1);
    int r = safe_stoi(fields[2], -1);
    if (c <= 0 || r <= 0 || c > 0xFFFF || r > 0xFFFF) return false;
    cols = c;
    rows = r;
    return true;
}

static void put_u16(std::string& out, unsigned v) {
    out += static_cast<char>((v >> 8) & 0xFF);
    out += static_cast<char>(v & 0xFF);
}

static unsigned get_u16(const std::string& s, size_t pos) {
    return (static_cast<unsigned char>(s[pos]) << 8) | static_cast<unsigned char>(s[pos + 1]);
}

std::string encode_data_frames(const char* data, size_t len) {
    std::string out;
    size_t pos = 0;
    while (pos < len) {
        size_t n = std::min(len - pos, ATTACH_MAX_PAYLOAD);
        out += static_cast<char>(AttachFrameType::Data);
        put_u16(out, static_cast<unsigned>(n));
        out.append(data + pos, n);
        pos += n;
    }
    return out;
}

std::string encode_resize_frame(int cols, int rows) {
    std::string out;
    out += static_cast<char>(AttachFrameType::Resize);
    put_u16(out, 4);
    put_u16(out, static_cast<unsigned>(cols));
    put_u16(out, static_cast<unsigned>(rows));
    return out;
}

void AttachDecoder::feed(const char* data, size_t len) {
    buf_.append(data, len);
}

bool AttachDecoder::next(AttachFrame& out) {
    if (bad_ || buf_.size() < 3) return false;

    char type = buf_[0];
    size_t len = get_u16(buf_, 1);
    if (type != static_cast<char>(AttachFrameType::Data) &&
        type != static_cast<char>(AttachFrameType::Resize)) {
        bad_ = true;
        return false;
    }
    if (buf_.size() < 3 + len) return false;

    out = AttachFrame{};
    out.type = static_cast<AttachFrameType>(type);
    out.payload = buf_.substr(3, len);
    buf_.erase(0, 3 + len);

    if (out.type == AttachFrameType::Resize) {
        if (len != 4) {
            bad_ = true;
            return false;
        }
        out.cols = static_cast<int>(get_u16(out.payload, 0));
        out.rows = static_cast<int>(get_u16(out.payload, 2));
    }
    return true;
}
