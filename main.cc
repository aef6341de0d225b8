#include <cctype>
#include <iostream>
#include <string>

#include <defines.hh>
#include <CharCodec.hh>
#include <LetterCaseSteganographer.hh>
#include <MarkdownSteganographer.hh>

// Disguise the secret with one carrier, reveal it back and check the result starts with the secret.
// Parameters:
// - carrier: Steganographer under test.
// - codec: Codec used for both directions.
// - secret: Letters (and spaces) to hide.
// - public_text: Carrier text with enough letters.
// Returns: true if the revealed text starts with the secret's letters.
template <typename AB>
bool run_test(const Bacon::Steganographer& carrier, const Bacon::BaconCodec<AB, char>& codec,
              const std::string& secret, const std::string& public_text)
{
    Bacon::Result<std::string> disguised = carrier.disguise(secret, public_text, codec);
    if (!disguised) {
        std::cerr << carrier.name() << " disguise failed: " << disguised.error().message() << std::endl;
        return false;
    }
    std::cout << carrier.name() << " disguised: " << disguised.value() << std::endl;

    Bacon::Result<std::string> revealed = carrier.reveal(disguised.value(), codec);
    if (!revealed) {
        std::cerr << carrier.name() << " reveal failed: " << revealed.error().message() << std::endl;
        return false;
    }
    std::cout << carrier.name() << " revealed: " << revealed.value() << std::endl;

    // Only letters survive the round trip, upper cased.
    std::string expected;
    for (char c : secret)
        if (Bacon::Steganographer::is_alphabetic(c))
            expected.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));

    if (revealed.value().compare(0, expected.size(), expected) != 0) {
        std::cout << BACON_CLI_RED << carrier.name() << " test failed: expected prefix " << expected
                  << BACON_CLI_RESET << std::endl;
        return false;
    }

    std::cout << BACON_CLI_GREEN << carrier.name() << " test passed" << BACON_CLI_RESET << std::endl;
    return true;
}

int main(void)
{
    const std::string secret = "My secret";
    const std::string public_text = "This is a public message that contains a secret one";

    Bacon::CharCodec<char> codec('a', 'b');
    std::string encoded;
    for (char c : codec.encode(secret))
        encoded.push_back(c);
    std::cout << "Encoded \"" << secret << "\": " << encoded << std::endl;
    std::cout << "-------------------" << std::endl;

    Bacon::LetterCaseSteganographer letter_case;
    if (!run_test(letter_case, codec, secret, public_text))
        return 1;

    std::cout << "-------------------" << std::endl;

    Bacon::Result<Bacon::MarkdownSteganographer> markdown =
        Bacon::MarkdownSteganographer::create(Bacon::Marker::emphasis(), Bacon::Marker("!", "!"));
    if (!markdown || !run_test(markdown.value(), codec, secret, public_text))
        return 1;

    std::cout << "-------------------" << std::endl;

    // Same text, booleans as alphabet.
    Bacon::CharCodecV2<bool> bool_codec(false, true);
    Bacon::Result<Bacon::MarkdownSteganographer> strong_only =
        Bacon::MarkdownSteganographer::create(Bacon::Marker::strong(), Bacon::Marker::empty());
    if (!strong_only || !run_test(strong_only.value(), bool_codec, secret, public_text))
        return 1;

    return 0;
}
