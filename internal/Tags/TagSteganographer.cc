#include "TagSteganographer.hh"

#include <QString>
#include <QXmlStreamReader>

#include <cctype>
#include <iostream>
#include <string>

namespace Bacon
{
    namespace
    {
        // Disguised text is a fragment: it gets a root so top level text is a child like any other.
        const QString kRootName = QStringLiteral("bacon-root");

        /**Length of the character or predefined entity reference at input[pos], 0 if there is none*/
        std::size_t entity_length(const std::string& input, std::size_t pos)
        {
            static const char* const kNamed[] = {"&amp;", "&lt;", "&gt;", "&quot;", "&apos;"};
            for (const char* named : kNamed)
                if (input.compare(pos, std::char_traits<char>::length(named), named) == 0)
                    return std::char_traits<char>::length(named);

            if (input.compare(pos, 2, "&#") != 0)
                return 0;
            std::size_t i = pos + 2;
            const bool hex = i < input.size() && input[i] == 'x';
            if (hex)
                ++i;
            const std::size_t digits_begin = i;
            while (i < input.size() && (hex ? std::isxdigit(static_cast<unsigned char>(input[i]))
                                            : std::isdigit(static_cast<unsigned char>(input[i]))))
                ++i;
            if (i == digits_begin || i >= input.size() || input[i] != ';')
                return 0;
            return i + 1 - pos;
        }

        /**Whether the '<' at input[pos] opens markup rather than being plain text*/
        bool opens_markup(const std::string& input, std::size_t pos)
        {
            if (pos + 1 >= input.size())
                return false;
            const char next = input[pos + 1];
            if (next == '!' || next == '?')
                return true;
            if (next != '/' && !Steganographer::is_alphabetic(next))
                return false;

            const std::size_t close = input.find('>', pos + 1);
            const std::size_t open = input.find('<', pos + 1);
            return close != std::string::npos && close < open;
        }

        /**
         * Escape '&' and '<' that markup readers would reject, like "Fish & chips" or "5 < 6".
         * Tags and entity references are kept.
         */
        std::string escape_stray_markup(const std::string& input)
        {
            std::string escaped;
            escaped.reserve(input.size());
            for (std::size_t i = 0; i < input.size(); ++i) {
                const char c = input[i];
                if (c == '&' && entity_length(input, i) == 0)
                    escaped += "&amp;";
                else if (c == '<' && !opens_markup(input, i))
                    escaped += "&lt;";
                else
                    escaped.push_back(c);
            }
            return escaped;
        }
    }

    TagSteganographer::TagSteganographer(Tag a_tag, Tag b_tag,
                                         std::optional<std::string> a_name, std::optional<std::string> b_name)
        : a_tag_(std::move(a_tag)), b_tag_(std::move(b_tag)),
          a_name_(std::move(a_name)), b_name_(std::move(b_name))
    {
    }

    std::optional<std::string> TagSteganographer::element_name(const Tag& tag)
    {
        const std::string& start = *tag.start();
        if (start.size() < 3 || start.front() != '<' || start.back() != '>' || start[1] == '/')
            return std::nullopt;

        std::string name = start.substr(1, start.size() - 2);
        for (char c : name)
            if (c == '<' || c == '>' || c == '/' || c == '&' || std::isspace(static_cast<unsigned char>(c)))
                return std::nullopt;

        if (*tag.end() != "</" + name + ">")
            return std::nullopt;
        return name;
    }

    Result<TagSteganographer> TagSteganographer::create(Tag a_tag, Tag b_tag)
    {
        if (std::optional<BaconError> error = check_marker_pair(a_tag, b_tag, "TagSteganographer"))
            return *error;

        std::optional<std::string> a_name;
        std::optional<std::string> b_name;
        std::string message;

        if (a_tag.is_defined() && !(a_name = element_name(a_tag)))
            message = "Not an open/close tag pair: " + a_tag.to_string();
        else if (b_tag.is_defined() && !(b_name = element_name(b_tag)))
            message = "Not an open/close tag pair: " + b_tag.to_string();
        else if (a_name && b_name && *a_name == *b_name)
            message = "Cannot use the same tag for both symbols: " + a_tag.to_string();

        if (!message.empty()) {
            std::cerr << BACON_CLI_RED << "TagSteganographer::create(): " << message << BACON_CLI_RESET << std::endl;
            return BaconError::steganographer(message);
        }

        return TagSteganographer(std::move(a_tag), std::move(b_tag), std::move(a_name), std::move(b_name));
    }

    TagSteganographer TagSteganographer::no_optimize_disguise_output() const
    {
        TagSteganographer copy(*this);
        copy.set_optimize_disguise(false);
        return copy;
    }

    std::string TagSteganographer::disguise_symbols(const SymbolStream& symbols, const std::string& public_text) const
    {
        return wrap_with_markers(symbols, public_text, this->a_tag_, this->b_tag_, this->optimize_disguise_);
    }

    std::vector<ParsedElement> TagSteganographer::parse(const std::string& input) const
    {
        std::optional<ElementType> undefined_side;
        if (!this->a_name_)
            undefined_side = ElementType::A;
        else if (!this->b_name_)
            undefined_side = ElementType::B;

        const QString document = QStringLiteral("<") + kRootName + QStringLiteral(">")
                                 + QString::fromStdString(escape_stray_markup(input))
                                 + QStringLiteral("</") + kRootName + QStringLiteral(">");
        QXmlStreamReader reader(document);

        // Type of every open element, innermost last
        std::vector<ElementType> open_elements;
        std::vector<ParsedElement> elements;

        while (!reader.atEnd()) {
            switch (reader.readNext()) {
                case QXmlStreamReader::StartElement: {
                    const std::string name = reader.name().toString().toStdString();
                    if (this->a_name_ && name == *this->a_name_)
                        open_elements.push_back(ElementType::A);
                    else if (this->b_name_ && name == *this->b_name_)
                        open_elements.push_back(ElementType::B);
                    else
                        open_elements.push_back(ElementType::Other);
                    break;
                }
                case QXmlStreamReader::EndElement:
                    if (!open_elements.empty())
                        open_elements.pop_back();
                    break;
                case QXmlStreamReader::Characters: {
                    if (open_elements.empty())
                        break;
                    ElementType type = open_elements.back();
                    if (type == ElementType::Other) {
                        if (!undefined_side)
                            break;
                        type = *undefined_side;
                    }
                    elements.push_back(ParsedElement{reader.text().toString().toStdString(), type});
                    break;
                }
                default:
                    break;
            }
        }

        if (reader.hasError()) {
            std::cerr << BACON_CLI_YELLOW << "TagSteganographer::reveal(): markup error at column "
                      << reader.columnNumber() << ": " << reader.errorString().toStdString()
                      << "; using the " << elements.size() << " text runs read so far." << BACON_CLI_RESET << std::endl;
        }
        return elements;
    }

    SymbolStream TagSteganographer::reveal_symbols(const std::string& input) const
    {
        return symbols_of(this->parse(input));
    }
} // Bacon
