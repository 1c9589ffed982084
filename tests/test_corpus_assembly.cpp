#include <catch2/catch.hpp>

#include "cutgraph/CorpusAssembly.h"
#include "cutgraph/Errors.h"
#include "test_support.hpp"

#include <set>

using namespace cutgraph;
using test_support::make_cut;
using test_support::make_supervision;
using test_support::store_constant_features;

TEST_CASE("make_cuts_from_supervisions builds one cut per supervision") {
    test_support::TempPath store(".sqlite");
    const auto left = store_constant_features(store.str(), "rec-0", "rec", 0, 20.0, 1.0f);
    const auto right = store_constant_features(store.str(), "rec-1", "rec", 1, 20.0, 2.0f);
    const features::FeatureSet featureSet({left, right});

    auto first = make_supervision("s1", 1.0, 2.0, "rec", 0);
    first.text = "one";
    const SupervisionSet supervisions({first, make_supervision("s2", 5.0, 3.0, "rec", 1),
                                       make_supervision("s3", 1.0, 2.0, "rec", 0)});

    const CutSet cuts = make_cuts_from_supervisions(supervisions, featureSet);
    REQUIRE(cuts.size() == 3);
    REQUIRE(cuts.mixed_cuts().empty());

    std::set<std::string> ids;
    auto supervision = supervisions.begin();
    for (const Cut* cut : cuts.simple_cuts()) {
        ids.insert(cut->id);
        REQUIRE(cut->start == supervision->start);
        REQUIRE(cut->duration == supervision->duration);
        REQUIRE(cut->channel == supervision->channelId);
        REQUIRE(cut->supervisions.size() == 1);
        REQUIRE(cut->supervisions.front() == *supervision);
        REQUIRE(cut->features == (supervision->channelId == 0 ? left : right));
        ++supervision;
    }
    REQUIRE(ids.size() == 3);

    const Cut* second = cuts.simple_cuts()[1];
    const FeatureMatrix m = second->load_features();
    REQUIRE(m.numFrames == 300);
    REQUIRE(m.at(0, 0) == Approx(2.0f));
}

TEST_CASE("make_cuts_from_supervisions fails without matching features") {
    test_support::TempPath store(".sqlite");
    const auto f = store_constant_features(store.str(), "rec-0", "rec", 0, 5.0, 1.0f);
    const features::FeatureSet featureSet({f});

    REQUIRE_THROWS_AS(make_cuts_from_supervisions(SupervisionSet({make_supervision("s", 1.0, 1.0, "other")}),
                                                  featureSet),
                      std::runtime_error);
    REQUIRE_THROWS_AS(make_cuts_from_supervisions(SupervisionSet({make_supervision("s", 4.0, 3.0, "rec")}),
                                                  featureSet),
                      std::runtime_error);
}

TEST_CASE("mix_stereo_cut_set downmixes channel pairs positionally") {
    test_support::TempPath store(".sqlite");
    const auto l = store_constant_features(store.str(), "l", "rec", 0, 10.0, 1.0f);
    const auto r = store_constant_features(store.str(), "r", "rec", 1, 10.0, 2.0f);
    const Cut l1 = make_cut(l, 0.0, 2.0, 0);
    const Cut r1 = make_cut(r, 0.0, 2.0, 1);
    const Cut l2 = make_cut(l, 4.0, 1.0, 0);
    const Cut r2 = make_cut(r, 4.0, 1.0, 1);
    const CutSet stereo({l1, r1, l2, r2});

    CutSet mono = mix_stereo_cut_set(stereo);
    REQUIRE(mono.size() == 2);
    const auto mixes = mono.mixed_cuts();
    REQUIRE(mixes.size() == 2);
    REQUIRE(mixes[0]->leftCutId == l1.id);
    REQUIRE(mixes[0]->rightCutId == r1.id);
    REQUIRE(mixes[1]->leftCutId == l2.id);
    REQUIRE(mixes[1]->rightCutId == r2.id);
    for (const MixedCut* mix : mixes) {
        REQUIRE(mix->offsetRightBy == 0.0);
        REQUIRE(mix->snr == 0.0);
    }

    // The downmix only names its sources until bound to them.
    REQUIRE_THROWS_AS(mono.load_features(mixes[0]->id), UnresolvedReferenceError);
    mono.with_source_cuts_from(stereo);
    const FeatureMatrix m = mono.load_features(mixes[1]->id);
    REQUIRE(m.numFrames == 100);
    REQUIRE(m.at(0, 0) == Approx(3.0f));
    REQUIRE(mono.duration(mixes[0]->id) == Approx(2.0));
}

// Positional pairing cannot detect a missing partner, so layouts that would
// pair the wrong cuts are reported instead of truncated to the shorter channel.
TEST_CASE("mix_stereo_cut_set rejects layouts it cannot pair") {
    features::Features f;
    const Cut l1 = make_cut(f, 0.0, 1.0, 0);
    const Cut r1 = make_cut(f, 0.0, 1.0, 1);
    const Cut l2 = make_cut(f, 1.0, 1.0, 0);
    const Cut x1 = make_cut(f, 0.0, 1.0, 2);

    SECTION("unequal cut counts per channel") {
        REQUIRE_THROWS_AS(mix_stereo_cut_set(CutSet({l1, r1, l2})), PreconditionError);
    }
    SECTION("a single channel") {
        REQUIRE_THROWS_AS(mix_stereo_cut_set(CutSet({l1, l2})), PreconditionError);
    }
    SECTION("more than two channels") {
        REQUIRE_THROWS_AS(mix_stereo_cut_set(CutSet({l1, r1, x1})), PreconditionError);
    }
    SECTION("mixed cuts in the input") {
        REQUIRE_THROWS_AS(mix_stereo_cut_set(CutSet({l1, r1, l1.overlay(r1)})), PreconditionError);
    }
    SECTION("an empty set") {
        REQUIRE_THROWS_AS(mix_stereo_cut_set(CutSet()), PreconditionError);
    }
}
