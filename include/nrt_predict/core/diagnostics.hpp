#pragma once

#include <ostream>
#include <streambuf>
#include <string>

namespace nrt_predict::core {

// Human-readable progress lines for the operator, silenced by `quiet`.
class Diagnostics {
public:
    explicit Diagnostics(std::ostream& out, bool quiet = false);

    // Section header, tagged with the current resident set size
    void section(const std::string& title);
    void info(const std::string& tag, const std::string& message);
    void warning(const std::string& message);

    // Errors are printed even when quiet
    void error(const std::string& message);

private:
    std::ostream& out_;
    bool quiet_;
};

class TeeBuf : public std::streambuf {
public:
    TeeBuf(std::streambuf* a, std::streambuf* b);

protected:
    int overflow(int c) override;
    int sync() override;

private:
    std::streambuf* a_;
    std::streambuf* b_;
};

} // namespace nrt_predict::core
