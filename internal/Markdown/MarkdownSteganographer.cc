#include "MarkdownSteganographer.hh"

#include <iostream>

namespace Bacon
{
    Result<MarkdownSteganographer> MarkdownSteganographer::create(Marker a_marker, Marker b_marker)
    {
        if (std::optional<BaconError> error = check_marker_pair(a_marker, b_marker, "MarkdownSteganographer"))
            return *error;

        if (a_marker.is_defined() && b_marker.is_defined()) {
            const std::string a_delims[] = {*a_marker.start(), *a_marker.end()};
            const std::string b_delims[] = {*b_marker.start(), *b_marker.end()};

            // A delimiter of one marker inside a delimiter of the other makes parsing ambiguous.
            for (const std::string& ad : a_delims) {
                for (const std::string& bd : b_delims) {
                    if (ad.find(bd) != std::string::npos || bd.find(ad) != std::string::npos) {
                        std::string message = "Cannot create a marker with " + a_marker.to_string()
                                              + " and " + b_marker.to_string();
                        std::cerr << BACON_CLI_RED << "MarkdownSteganographer::create(): " << message
                                  << BACON_CLI_RESET << std::endl;
                        return BaconError::steganographer(std::move(message));
                    }
                }
            }
        }

        return MarkdownSteganographer(std::move(a_marker), std::move(b_marker));
    }

    std::string MarkdownSteganographer::disguise_symbols(const SymbolStream& symbols,
                                                         const std::string& public_text) const
    {
        return wrap_with_markers(symbols, public_text, this->a_marker_, this->b_marker_, true);
    }

    std::vector<MarkdownSteganographer::Span> MarkdownSteganographer::scan(const std::string& input) const
    {
        std::vector<Span> spans;
        const std::size_t n = input.size();
        std::size_t pos = 0;

        while (pos < n) {
            const std::size_t a_pos = this->a_marker_.start() ? input.find(*this->a_marker_.start(), pos) : std::string::npos;
            const std::size_t b_pos = this->b_marker_.start() ? input.find(*this->b_marker_.start(), pos) : std::string::npos;
            if (a_pos == b_pos)
                break;  // none found, or ambiguous

            const bool is_a = a_pos < b_pos;
            const Marker& marker = is_a ? this->a_marker_ : this->b_marker_;
            const std::size_t start_pos = is_a ? a_pos : b_pos;
            const std::size_t content_begin = start_pos + marker.start()->size();
            if (content_begin >= n)
                break;  // start marker at the very end, nothing inside

            // Delimiters are non-empty, so every round moves past at least one start marker.
            const std::string& end_delim = *marker.end();
            const std::size_t end_pos = input.find(end_delim, content_begin);
            const std::size_t content_end = end_pos == std::string::npos ? n : end_pos;
            const std::size_t next = end_pos == std::string::npos ? n : end_pos + end_delim.size();

            Span span;
            span.element.text = input.substr(content_begin, content_end - content_begin);
            span.element.type = is_a ? ElementType::A : ElementType::B;
            span.begin = start_pos;
            span.end = next;
            spans.push_back(std::move(span));

            pos = next;
        }
        return spans;
    }

    std::vector<ParsedElement> MarkdownSteganographer::infer_unmarked(const std::string& input,
                                                                      const std::vector<Span>& spans) const
    {
        const ElementType inferred = this->a_marker_.is_empty() ? ElementType::A : ElementType::B;

        std::vector<ParsedElement> elements;
        elements.reserve(spans.size() * 2);
        std::size_t cursor = 0;

        auto add_unmarked = [&](std::size_t begin, std::size_t end) {
            for (std::size_t i = begin; i < end; ++i)
                elements.push_back(ParsedElement{std::string(1, input[i]), inferred});
        };

        for (const Span& span : spans) {
            add_unmarked(cursor, span.begin);
            elements.push_back(span.element);
            cursor = span.end;
        }
        add_unmarked(cursor, input.size());
        return elements;
    }

    std::vector<ParsedElement> MarkdownSteganographer::parse(const std::string& input) const
    {
        std::vector<Span> spans = this->scan(input);

        if (this->a_marker_.is_empty() || this->b_marker_.is_empty())
            return this->infer_unmarked(input, spans);

        std::vector<ParsedElement> elements;
        elements.reserve(spans.size());
        for (Span& span : spans)
            elements.push_back(std::move(span.element));
        return elements;
    }

    SymbolStream MarkdownSteganographer::reveal_symbols(const std::string& input) const
    {
        return symbols_of(this->parse(input));
    }
} // Bacon
