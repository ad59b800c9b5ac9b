#ifndef ZONE_LOG_INDENT_STREAMBUF_HPP
#define ZONE_LOG_INDENT_STREAMBUF_HPP

#include <cstddef>
#include <cstring>
#include <streambuf>
#include <string>

namespace zonelog {
namespace detail {

    /// Output-only streambuf decorator that re-indents continuation lines.
    ///
    /// Every '\n' written through it is replaced by @p terminator followed
    /// by @p width spaces; all other bytes pass straight to the wrapped
    /// buffer. No put area is installed, so nothing is held back: each
    /// chunk is split and forwarded as it arrives.
    ///
    /// A short write on the wrapped buffer is reported as a short write
    /// here, which makes the owning std::ostream set badbit.
    class IndentStreambuf : public std::streambuf {
    public:
        IndentStreambuf(std::streambuf *target, const std::string &terminator, size_t width)
            : m_target(target)
            , m_terminator(terminator)
            , m_padding(width, ' ') {}

        IndentStreambuf(const IndentStreambuf &) = delete;
        IndentStreambuf &operator=(const IndentStreambuf &) = delete;

    protected:
        std::streamsize xsputn(const char *s, std::streamsize n) override {
            std::streamsize done = 0;
            while (done < n) {
                const char *begin = s + done;
                const void *found = std::memchr(begin, '\n', static_cast<size_t>(n - done));
                const char *lineBreak = static_cast<const char *>(found);
                std::streamsize len = lineBreak ? (lineBreak - begin) : (n - done);

                if (len > 0 && m_target->sputn(begin, len) != len) return done;
                done += len;

                if (lineBreak) {
                    if (!writeBreak()) return done;
                    ++done;
                }
            }
            return n;
        }

        int_type overflow(int_type ch) override {
            if (traits_type::eq_int_type(ch, traits_type::eof())) {
                return traits_type::not_eof(ch);
            }
            char c = traits_type::to_char_type(ch);
            if (c == '\n') {
                return writeBreak() ? ch : traits_type::eof();
            }
            if (traits_type::eq_int_type(m_target->sputc(c), traits_type::eof())) {
                return traits_type::eof();
            }
            return ch;
        }

        int sync() override {
            return m_target->pubsync();
        }

    private:
        bool writeBreak() {
            std::streamsize termLen = static_cast<std::streamsize>(m_terminator.size());
            if (termLen > 0 && m_target->sputn(m_terminator.data(), termLen) != termLen) {
                return false;
            }
            std::streamsize padLen = static_cast<std::streamsize>(m_padding.size());
            if (padLen > 0 && m_target->sputn(m_padding.data(), padLen) != padLen) {
                return false;
            }
            return true;
        }

        std::streambuf *m_target;
        const std::string &m_terminator;
        std::string m_padding;
    };

} // namespace detail
} // namespace zonelog

#endif // ZONE_LOG_INDENT_STREAMBUF_HPP
