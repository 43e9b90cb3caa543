#pragma once

#include <ostream>
#include <streambuf>
#include <string>
#include <vector>

// Line-buffered stream that forwards each completed line to LogUtils,
// prefixed with a tag, and keeps a transcript of everything written.
class LogStreamBuf : public std::streambuf {
public:
    explicit LogStreamBuf(std::string tag);
    ~LogStreamBuf() override;

    const std::vector<std::string>& lines() const { return lines_; }

protected:
    int_type overflow(int_type ch) override;
    std::streamsize xsputn(const char* s, std::streamsize count) override;
    int sync() override;

private:
    void emit_line();

    std::string tag_;
    std::string pending_;
    std::vector<std::string> lines_;
};

class LogStream : public std::ostream {
public:
    explicit LogStream(const std::string& tag);

    const std::vector<std::string>& lines() const { return buf_.lines(); }

private:
    LogStreamBuf buf_;
};
