#ifndef BACONSTEGO_BACONERROR_HH
#define BACONSTEGO_BACONERROR_HH

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace Bacon
{
    enum class ErrorKind : uint8_t
    {
        General, Codec, Steganographer
    };

    /**Error reported as a value by codecs and steganographers*/
    class BaconError
    {
    private:
        ErrorKind kind_;
        std::string message_;

    public:
        BaconError(ErrorKind kind, std::string message)
            : kind_(kind), message_(std::move(message)) {}

        static BaconError general(std::string message)
        { return BaconError(ErrorKind::General, std::move(message)); }

        static BaconError codec(std::string message)
        { return BaconError(ErrorKind::Codec, std::move(message)); }

        static BaconError steganographer(std::string message)
        { return BaconError(ErrorKind::Steganographer, std::move(message)); }

        [[nodiscard]] ErrorKind kind() const { return this->kind_; }

        [[nodiscard]] const std::string& message() const { return this->message_; }

        /**
         * Generic description of the error kind
         * @return e.g. "A general error occurred"
         */
        [[nodiscard]] std::string describe() const;

        bool operator==(const BaconError& other) const
        { return this->kind_ == other.kind_ && this->message_ == other.message_; }

        bool operator!=(const BaconError& other) const
        { return !(*this == other); }
    };

    /**
     * Value or BaconError.
     * Operations report failures through the BaconError alternative; callers check ok() first.
     * Accessing the wrong alternative breaks that precondition and throws std::logic_error.
     */
    template <typename T>
    class Result
    {
    private:
        std::variant<T, BaconError> data_;

    public:
        Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
        Result(BaconError error) : data_(std::in_place_index<1>, std::move(error)) {}

        [[nodiscard]] bool ok() const { return this->data_.index() == 0; }

        explicit operator bool() const { return this->ok(); }

        /**
         * @pre ok()
         * @throw std::logic_error if the result holds an error
         */
        T& value()
        {
            if (!this->ok())
                throw std::logic_error("Result::value(): " + std::get<1>(this->data_).message());
            return std::get<0>(this->data_);
        }

        const T& value() const
        {
            if (!this->ok())
                throw std::logic_error("Result::value(): " + std::get<1>(this->data_).message());
            return std::get<0>(this->data_);
        }

        /**
         * @pre !ok()
         * @throw std::logic_error if the result holds a value
         */
        const BaconError& error() const
        {
            if (this->ok())
                throw std::logic_error("Result::error(): result holds a value");
            return std::get<1>(this->data_);
        }

        T& operator*() { return this->value(); }
        const T& operator*() const { return this->value(); }
        T* operator->() { return &this->value(); }
        const T* operator->() const { return &this->value(); }
    };
} // Bacon

#endif //BACONSTEGO_BACONERROR_HH
