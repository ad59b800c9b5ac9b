#ifndef ZONE_LOG_ZONED_FORMATTER_HPP
#define ZONE_LOG_ZONED_FORMATTER_HPP

#include "formatter_interface.hpp"
#include "format_policy.hpp"
#include "level_style.hpp"
#include "line_renderer.hpp"
#include <memory>
#include <utility>

namespace zonelog {
    /// Formatter that renders each record with a fresh LineRenderer.
    ///
    /// The policy is copied in and never changed, so one ZonedFormatter can
    /// serve concurrent callers; the sink is responsible for serializing
    /// access to the output stream itself.
    class ZonedFormatter : public IFormatter {
    public:
        ZonedFormatter()
            : m_style(std::make_shared<PlainStyle>()) {}

        explicit ZonedFormatter(FormatPolicy policy)
            : m_policy(std::move(policy))
            , m_style(std::make_shared<PlainStyle>()) {}

        ZonedFormatter(FormatPolicy policy, std::shared_ptr<const ILevelStyle> style)
            : m_policy(std::move(policy))
            , m_style(std::move(style)) {
            if (!m_style) m_style = std::make_shared<PlainStyle>();
        }

        void format(const LogRecord &record, std::ostream &out) const override {
            LineRenderer renderer(m_policy, out, *m_style);
            renderer.render(record);
        }

        const FormatPolicy &policy() const { return m_policy; }
        const ILevelStyle &style() const { return *m_style; }

    private:
        FormatPolicy m_policy;
        std::shared_ptr<const ILevelStyle> m_style;
    };
} // namespace zonelog

#endif // ZONE_LOG_ZONED_FORMATTER_HPP
