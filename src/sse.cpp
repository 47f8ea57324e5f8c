#include "sse.hpp"

namespace paragate {

std::string format_sse_event(const std::string& event, const std::string& data) {
    std::string out;
    out.reserve(data.size() + event.size() + 16);
    if (!event.empty()) {
        out += "event: " + event + "\n";
    }
    size_t start = 0;
    while (true) {
        size_t nl = data.find('\n', start);
        out += "data: ";
        if (nl == std::string::npos) {
            out.append(data, start, std::string::npos);
            out += '\n';
            break;
        }
        out.append(data, start, nl - start);
        out += '\n';
        start = nl + 1;
    }
    out += '\n';
    return out;
}

std::string format_sse_comment(const std::string& text) {
    return ": " + text + "\n\n";
}

} // namespace paragate
