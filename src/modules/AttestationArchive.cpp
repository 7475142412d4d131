// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline

#include "modules/AttestationArchive.hpp"
#include "core/VigilErrors.hpp"
#include "utils/RecordCodec.hpp"
#include "utils/StorageUtils.hpp"
#include <iostream>
#include <nlohmann/json.hpp>

namespace Vigil::Modules {

    AttestationArchive::AttestationArchive(std::filesystem::path dataDir) : dir(std::move(dataDir)) {
        if (!VigilUtils::ensureSecureDirectory(dir.string())) {
            throw Core::ConfigError("data_dir is not usable: " + dir.string());
        }
    }

    bool AttestationArchive::saveSamples(const Core::RingSnapshot& snapshot) {
        nlohmann::json samples = nlohmann::json::array();
        for (const auto& sample : snapshot.samples) {
            samples.push_back(VigilUtils::sampleToJson(sample));
        }

        std::lock_guard<std::mutex> guard(writeMutex);
        return VigilUtils::writeFileAtomic((dir / "samples.json").string(), samples.dump(2));
    }

    bool AttestationArchive::saveBatch(const Core::Batch& batch, const Core::Bitmap& bitmap) {
        nlohmann::json record = VigilUtils::batchToJson(batch);
        record["partial"] = batch.partial;

        std::lock_guard<std::mutex> guard(writeMutex);
        bool ok = VigilUtils::writeFileAtomic((dir / "batch.json").string(), record.dump(2));
        ok = VigilUtils::writeFileAtomic((dir / "bitmap.hex").string(), VigilUtils::bitmapToHex(bitmap) + "\n") && ok;
        if (ok && VigilUtils::VERBOSE) {
            std::cout << "[Archive] batch " << batch.window.start << ".." << batch.window.end
                      << " written to " << dir << std::endl;
        }
        return ok;
    }

    bool AttestationArchive::saveProof(const Core::ProofArtifact& proof) {
        std::lock_guard<std::mutex> guard(writeMutex);
        return VigilUtils::writeFileAtomic((dir / "proof.json").string(), VigilUtils::proofToJson(proof).dump(2));
    }
}
