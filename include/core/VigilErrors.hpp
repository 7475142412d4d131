// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline

#ifndef VIGIL_ERRORS_HPP
#define VIGIL_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace Vigil::Core {

    class VigilError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Malformed or unreadable observation. Logged, dropped, snapshot unchanged.
    class IngestionError : public VigilError {
    public:
        using VigilError::VigilError;
    };

    // Programming defect (timestamp regression, broken capacity). Aborts the tick.
    class BufferInvariantViolation : public VigilError {
    public:
        using VigilError::VigilError;
    };

    // The batch is still posted, flagged without proof.
    class ProofGenerationError : public VigilError {
    public:
        using VigilError::VigilError;
    };

    // Raised once the retry budget is spent. The pipeline keeps ticking.
    class PostingError : public VigilError {
    public:
        using VigilError::VigilError;
    };

    // Startup-fatal.
    class ConfigError : public VigilError {
    public:
        using VigilError::VigilError;
    };

    class CryptoError : public VigilError {
    public:
        using VigilError::VigilError;
    };
}

#endif
