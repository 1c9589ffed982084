#include "cutgraph/CorpusAssembly.h"

#include "cutgraph/Errors.h"
#include "cutgraph/Logging.h"

#include <algorithm>
#include <string>
#include <vector>

namespace cutgraph {

CutSet make_cuts_from_supervisions(const SupervisionSet& supervisions, const features::FeatureSet& featureSet) {
    CutSet cuts;
    for (const auto& supervision : supervisions) {
        Cut cut;
        cut.id = make_cut_id();
        cut.channel = supervision.channelId;
        cut.start = supervision.start;
        cut.duration = supervision.duration;
        cut.features = featureSet.find(supervision.recordingId, supervision.channelId, supervision.start,
                                       supervision.duration);
        cut.supervisions.push_back(supervision);
        cuts.add(std::move(cut));
    }
    log_message(LogLevel::Debug, "CorpusAssembly",
                "Built " + std::to_string(cuts.size()) + " cuts from supervisions");
    return cuts;
}

CutSet mix_stereo_cut_set(const CutSet& cuts) {
    if (!cuts.mixed_cuts().empty()) {
        throw PreconditionError("Stereo downmix expects plain cuts only, found " +
                                std::to_string(cuts.mixed_cuts().size()) + " mixed cuts");
    }

    // Channels in order of first appearance.
    std::vector<int> channels;
    for (const Cut* cut : cuts.simple_cuts()) {
        if (std::find(channels.begin(), channels.end(), cut->channel) == channels.end()) {
            channels.push_back(cut->channel);
        }
    }
    if (channels.size() != 2) {
        throw PreconditionError("Stereo downmix expects exactly 2 channels, found " +
                                std::to_string(channels.size()));
    }

    std::vector<const Cut*> first;
    std::vector<const Cut*> second;
    for (const Cut* cut : cuts.simple_cuts()) {
        (cut->channel == channels[0] ? first : second).push_back(cut);
    }
    if (first.size() != second.size()) {
        throw PreconditionError("Stereo downmix expects the same number of cuts per channel, found " +
                                std::to_string(first.size()) + " on channel " + std::to_string(channels[0]) +
                                " and " + std::to_string(second.size()) + " on channel " +
                                std::to_string(channels[1]));
    }

    CutSet mixed;
    for (std::size_t i = 0; i < first.size(); ++i) {
        mixed.add(first[i]->overlay(*second[i]));
    }
    log_message(LogLevel::Debug, "CorpusAssembly",
                "Downmixed " + std::to_string(mixed.size()) + " channel pairs");
    return mixed;
}

}  // namespace cutgraph
