#pragma once
#include "zone_log/sink/sink_interface.hpp"
#include <ostream>
#include <streambuf>

namespace zonelog {

/// Streambuf that accepts and discards everything, so benchmarks measure
/// rendering cost rather than I/O.
class NullStreambuf : public std::streambuf {
protected:
    std::streamsize xsputn(const char*, std::streamsize n) override { return n; }
    int_type overflow(int_type ch) override { return traits_type::not_eof(ch); }
};

/// Sink that formats every record into a discarding stream.
class NullSink : public ISink {
public:
    NullSink() : m_out(&m_buf) {}

    void write(const LogRecord& record) override {
        if (m_formatter) m_formatter->format(record, m_out);
    }

private:
    NullStreambuf m_buf;
    std::ostream m_out;
};

} // namespace zonelog
