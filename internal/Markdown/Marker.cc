#include "Marker.hh"

#include <iostream>

namespace Bacon
{
    std::string Marker::to_string() const
    {
        auto part = [](const std::optional<std::string>& s) {
            return s ? "\"" + *s + "\"" : std::string("None");
        };
        return "Marker(" + part(this->start_) + ", " + part(this->end_) + ")";
    }

    std::optional<BaconError> check_marker_pair(const Marker& a_marker, const Marker& b_marker, const char* owner)
    {
        std::string message;
        if (a_marker.is_empty() && b_marker.is_empty())
            message = "At least one of the markers must be defined";
        else if (!a_marker.is_empty() && !a_marker.is_defined())
            message = "A marker must define both start and end, or none: " + a_marker.to_string();
        else if (!b_marker.is_empty() && !b_marker.is_defined())
            message = "A marker must define both start and end, or none: " + b_marker.to_string();
        else if ((a_marker.is_defined() && (a_marker.start()->empty() || a_marker.end()->empty()))
                 || (b_marker.is_defined() && (b_marker.start()->empty() || b_marker.end()->empty())))
            message = "Marker delimiters cannot be empty strings: " + a_marker.to_string() + " and " + b_marker.to_string();

        if (message.empty())
            return std::nullopt;

        std::cerr << BACON_CLI_RED << owner << "::create(): " << message << BACON_CLI_RESET << std::endl;
        return BaconError::steganographer(message);
    }

    std::string replace_all(const std::string& text, const std::string& pattern, const std::string& replacement)
    {
        if (pattern.empty())
            return text;

        std::string result;
        result.reserve(text.size());
        std::size_t pos = 0;
        while (true) {
            const std::size_t found = text.find(pattern, pos);
            if (found == std::string::npos)
                break;
            result.append(text, pos, found - pos);
            result.append(replacement);
            pos = found + pattern.size();
        }
        result.append(text, pos, std::string::npos);
        return result;
    }

    std::string wrap_with_markers(const SymbolStream& symbols, const std::string& public_text,
                                  const Marker& a_marker, const Marker& b_marker, bool merge)
    {
        const std::string a_start = a_marker.start_string();
        const std::string a_end = a_marker.end_string();
        const std::string b_start = b_marker.start_string();
        const std::string b_end = b_marker.end_string();

        std::string disguised = Steganographer::walk_public(public_text, symbols,
            [&](std::string& out, char pc, Symbol symbol) {
                if (symbol == Symbol::A) {
                    out.append(a_start);
                    out.push_back(pc);
                    out.append(a_end);
                } else {
                    out.append(b_start);
                    out.push_back(pc);
                    out.append(b_end);
                }
            });

        if (!merge)
            return disguised;

        disguised = replace_all(disguised, a_end + a_start, "");
        return replace_all(disguised, b_end + b_start, "");
    }
} // Bacon
