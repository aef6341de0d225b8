#include "BaconError.hh"

namespace Bacon
{
    std::string BaconError::describe() const
    {
        switch (this->kind_) {
            case ErrorKind::General:
                return "A general error occurred";
            case ErrorKind::Codec:
                return "An error coming from a codec occurred";
            case ErrorKind::Steganographer:
                return "An error coming from a steganographer occurred";
        }
        return "Unknown error";
    }
} // Bacon
