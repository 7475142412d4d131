// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline

#ifndef VIGIL_ATTESTATION_ARCHIVE_HPP
#define VIGIL_ATTESTATION_ARCHIVE_HPP

#include <filesystem>
#include <mutex>

#include "AttestationTypes.hpp"
#include "core/SampleRing.hpp"

namespace Vigil::Modules {

    /**
     * @brief Latest derived artifacts under the data directory:
     * samples.json, batch.json, bitmap.hex, proof.json.
     * Every file is replaced atomically; a false return means the old copy is still intact.
     */
    class AttestationArchive {
    private:
        std::filesystem::path dir;
        std::mutex writeMutex;

    public:
        // Throws ConfigError if the directory cannot be created
        explicit AttestationArchive(std::filesystem::path dataDir);

        bool saveSamples(const Core::RingSnapshot& snapshot);
        bool saveBatch(const Core::Batch& batch, const Core::Bitmap& bitmap);
        bool saveProof(const Core::ProofArtifact& proof);

        const std::filesystem::path& directory() const { return dir; }
    };
}

#endif
