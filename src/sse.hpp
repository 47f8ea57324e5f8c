#pragma once
#include <string>

namespace paragate {

// Encode one event in text/event-stream framing. Every line of `data` gets
// its own "data:" field.
std::string format_sse_event(const std::string& event, const std::string& data);

// Encode a comment line (ignored by clients, keeps idle connections alive).
std::string format_sse_comment(const std::string& text);

} // namespace paragate
