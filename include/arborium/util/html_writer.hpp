#ifndef ARBORIUM_HTML_WRITER_HPP
#define ARBORIUM_HTML_WRITER_HPP

#include <cstddef>
#include <memory_resource>
#include <string_view>
#include <utility>
#include <vector>

#include "arborium/util/assert.hpp"
#include "arborium/util/html.hpp"
#include "arborium/util/strings.hpp"

namespace arborium {

/// @brief Appends text to a vector without any processing.
inline void append(std::pmr::vector<char8_t>& out, std::u8string_view text)
{
    out.insert(out.end(), text.data(), text.data() + text.size());
}

/// @brief A class which provides member functions for writing HTML snippets
/// to a consumer correctly.
/// This writer only performs checks that are possible without additional memory.
/// These include:
/// - verifying that given tag names are appropriate
/// - ensuring that the number of opened tags matches the number of closed tags
///
/// To correctly use this class, the opening tags must match the closing tags.
/// I.e. for every `open_tag(id)`, there must be a matching `close_tag(id)`.
template <string_or_char_consumer Out>
struct Basic_HTML_Writer {
public:
    using Self = Basic_HTML_Writer;

private:
    Out m_out;

    std::size_t m_depth = 0;

public:
    [[nodiscard]]
    explicit Basic_HTML_Writer(const Out& out)
        : m_out { out }
    {
    }
    [[nodiscard]]
    explicit Basic_HTML_Writer(Out&& out)
        : m_out { std::move(out) }
    {
    }

    Basic_HTML_Writer(const Basic_HTML_Writer&) = delete;
    Basic_HTML_Writer& operator=(const Basic_HTML_Writer&) = delete;

    ~Basic_HTML_Writer() = default;

    /// @brief Returns the consumer that this writer has been constructed with,
    /// and to which all output is written.
    [[nodiscard]]
    const Out& get_output() const
    {
        return m_out;
    }

    /// @brief Returns `true` if every opened tag has been closed.
    [[nodiscard]]
    bool is_done() const
    {
        return m_depth == 0;
    }

    /// @brief Writes an opening tag such as `<a-k>`.
    Self& open_tag(std::u8string_view id)
    {
        ARBORIUM_ASSERT(is_ascii_html_tag_name(id));

        m_out(u8'<');
        m_out(id);
        m_out(u8'>');
        ++m_depth;

        return *this;
    }

    /// @brief Writes a closing tag, such as `</a-k>`.
    /// The most recent call to `open_tag` shall have been made with the same argument.
    Self& close_tag(std::u8string_view id)
    {
        ARBORIUM_ASSERT(is_ascii_html_tag_name(id));
        ARBORIUM_ASSERT(m_depth != 0);

        --m_depth;

        m_out(u8"</");
        m_out(id);
        m_out(u8'>');

        return *this;
    }

    /// @brief Writes text between tags.
    /// Characters such as `<` or `&` which interfere with HTML are converted to entities.
    Self& write_inner_text(std::u8string_view text)
    {
        append_html_escaped_of(m_out, text, html_text_escaped_chars);
        return *this;
    }

    /// @brief Writes HTML content between tags, without any escaping.
    Self& write_inner_html(std::u8string_view html)
    {
        m_out(html);
        return *this;
    }
};

/// @brief A consumer which appends everything to a vector of UTF-8 code units.
struct Vector_Consumer {
    std::pmr::vector<char8_t>* out;

    void operator()(std::u8string_view str) const
    {
        append(*out, str);
    }

    void operator()(char8_t c) const
    {
        out->push_back(c);
    }
};

using HTML_Writer = Basic_HTML_Writer<Vector_Consumer>;

} // namespace arborium

#endif
