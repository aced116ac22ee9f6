#include "errors.hpp"

const char* user_message(const PrintError& error) {
    switch (error.kind()) {
        case PrintError::Kind::Decode:
            return "Could not read the image.";
        case PrintError::Kind::DeviceNotFound:
            return "No printer found.";
        case PrintError::Kind::Cancelled:
            return "Printing was cancelled.";
        case PrintError::Kind::FrameTooLarge:
        case PrintError::Kind::ConnectionLost:
        case PrintError::Kind::WriteFailed:
            break;
    }
    return "Printing failed.";
}
