#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

// Wire format between `recon attach` (inside a spawned terminal) and the
// engine, over a Unix-domain socket.
//
//   attach -> engine:  "RECON-ATTACH <cols> <rows>\n", then frames
//   engine -> attach:  raw terminal output
//
// Frame: 1 byte type, 2 byte big-endian payload length, payload.
//   'D'  keyboard bytes
//   'R'  window size, cols and rows as 2 byte big-endian each

enum class AttachFrameType : char {
    Data = 'D',
    Resize = 'R',
};

struct AttachFrame {
    AttachFrameType type = AttachFrameType::Data;
    std::string payload;
    int cols = 0;          // Resize
    int rows = 0;
};

constexpr size_t ATTACH_MAX_PAYLOAD = 0xFFFF;

std::string build_attach_hello(int cols, int rows);

// Accepts exactly one hello line (trailing newline optional).
bool parse_attach_hello(const std::string& line, int& cols, int& rows);

// Encode keyboard bytes, split into as many frames as needed.
std::string encode_data_frames(const char* data, size_t len);
std::string encode_resize_frame(int cols, int rows);

// Incremental decoder for the attach -> engine stream.
class AttachDecoder {
public:
    void feed(const char* data, size_t len);

    // Next complete frame. False when more bytes are needed or the stream
    // is corrupt (see bad()).
    bool next(AttachFrame& out);

    bool bad() const { return bad_; }

private:
    std::string buf_;
    bool bad_ = false;
};
