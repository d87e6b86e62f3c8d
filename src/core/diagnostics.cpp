#include "nrt_predict/core/diagnostics.hpp"
#include "nrt_predict/core/utils.hpp"

namespace nrt_predict::core {

Diagnostics::Diagnostics(std::ostream& out, bool quiet)
    : out_(out), quiet_(quiet) {}

void Diagnostics::section(const std::string& title) {
    if (quiet_) return;
    out_ << "\n# " << title << " [MEM " << format_bytes(current_rss_bytes()) << "]\n"
         << std::endl;
}

void Diagnostics::info(const std::string& tag, const std::string& message) {
    if (quiet_) return;
    if (tag.empty()) {
        out_ << message << std::endl;
    } else {
        out_ << "[" << tag << "] " << message << std::endl;
    }
}

void Diagnostics::warning(const std::string& message) {
    if (quiet_) return;
    out_ << "\nWarning: " << message << std::endl;
}

void Diagnostics::error(const std::string& message) {
    out_ << "\nError: " << message << std::endl;
}

TeeBuf::TeeBuf(std::streambuf* a, std::streambuf* b) : a_(a), b_(b) {}

int TeeBuf::overflow(int c) {
    if (c == EOF)
        return EOF;
    const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
    const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
    return (ra == EOF || rb == EOF) ? EOF : c;
}

int TeeBuf::sync() {
    int ra = a_ ? a_->pubsync() : 0;
    int rb = b_ ? b_->pubsync() : 0;
    return (ra == 0 && rb == 0) ? 0 : -1;
}

} // namespace nrt_predict::core
