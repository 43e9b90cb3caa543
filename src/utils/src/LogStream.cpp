#include "LogStream.hpp"
#include "LogUtils.hpp"

LogStreamBuf::LogStreamBuf(std::string tag) : tag_(std::move(tag)) {}

LogStreamBuf::~LogStreamBuf() {
    if (!pending_.empty()) {
        emit_line();
    }
}

LogStreamBuf::int_type LogStreamBuf::overflow(int_type ch) {
    if (traits_type::eq_int_type(ch, traits_type::eof())) {
        return traits_type::not_eof(ch);
    }

    const char c = traits_type::to_char_type(ch);
    if (c == '\n') {
        emit_line();
    } else {
        pending_.push_back(c);
    }
    return ch;
}

std::streamsize LogStreamBuf::xsputn(const char* s, std::streamsize count) {
    for (std::streamsize i = 0; i < count; ++i) {
        overflow(traits_type::to_int_type(s[i]));
    }
    return count;
}

// Partial lines stay pending until the newline arrives
int LogStreamBuf::sync() {
    return 0;
}

void LogStreamBuf::emit_line() {
    if (!pending_.empty() && pending_.back() == '\r') {
        pending_.pop_back();
    }
    LogUtils::info("[{}] {}", tag_, pending_);
    lines_.push_back(std::move(pending_));
    pending_.clear();
}

LogStream::LogStream(const std::string& tag) : std::ostream(nullptr), buf_(tag) {
    rdbuf(&buf_);
}
