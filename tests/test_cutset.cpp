#include <catch2/catch.hpp>

#include "cutgraph/CutSet.h"
#include "cutgraph/Errors.h"
#include "test_support.hpp"

using namespace cutgraph;
using test_support::make_cut;
using test_support::make_supervision;
using test_support::store_constant_features;

namespace {

features::Features dummy_features() {
    features::Features f;
    f.recordingId = "rec";
    f.duration = 60.0;
    f.storageType = contract::SQLITE_STORAGE_TYPE;
    f.storagePath = "unused.sqlite";
    return f;
}

}  // namespace

TEST_CASE("CutSet keeps insertion order") {
    const Cut a = make_cut(dummy_features(), 0.0, 1.0);
    const Cut b = make_cut(dummy_features(), 1.0, 1.0);
    const MixedCut m = a.overlay(b);
    const CutSet cuts({b, m, a});

    REQUIRE(cuts.size() == 3);
    REQUIRE(cuts.ids() == std::vector<std::string>{b.id, m.id, a.id});

    std::vector<std::string> visited;
    for (const auto& cut : cuts) visited.push_back(cut_id(cut));
    REQUIRE(visited == cuts.ids());

    REQUIRE(cuts.simple_cuts().size() == 2);
    REQUIRE(cuts.mixed_cuts().size() == 1);
    REQUIRE(cuts.mixed_cuts().front()->id == m.id);
}

TEST_CASE("CutSet lookup by id") {
    const Cut a = make_cut(dummy_features(), 0.0, 1.0);
    const CutSet cuts({a});

    REQUIRE(cuts.contains(a.id));
    REQUIRE(cuts.find(a.id) != nullptr);
    REQUIRE(std::get<Cut>(cuts.at(a.id)) == a);
    REQUIRE_FALSE(cuts.contains("nope"));
    REQUIRE(cuts.find("nope") == nullptr);
    REQUIRE_THROWS_AS(cuts.at("nope"), UnresolvedReferenceError);
}

TEST_CASE("Adding an existing id replaces the cut in place") {
    const Cut a = make_cut(dummy_features(), 0.0, 1.0);
    const Cut b = make_cut(dummy_features(), 1.0, 1.0);
    CutSet cuts({a, b});

    Cut replacement = a;
    replacement.duration = 0.5;
    cuts.add(replacement);

    REQUIRE(cuts.size() == 2);
    REQUIRE(cuts.ids().front() == a.id);
    REQUIRE(std::get<Cut>(cuts.at(a.id)).duration == 0.5);
}

TEST_CASE("Union merges both sets and the right side wins on collisions") {
    const Cut a = make_cut(dummy_features(), 0.0, 1.0);
    const Cut b = make_cut(dummy_features(), 1.0, 1.0);
    const Cut c = make_cut(dummy_features(), 2.0, 1.0);
    Cut otherA = a;
    otherA.channel = 1;

    const CutSet lhs({a, b});
    const CutSet rhs({c, otherA});
    const CutSet merged = lhs + rhs;

    REQUIRE(merged.size() == 3);
    REQUIRE(merged.ids() == std::vector<std::string>{a.id, b.id, c.id});
    REQUIRE(std::get<Cut>(merged.at(a.id)).channel == 1);
    REQUIRE(lhs.size() == 2);
    REQUIRE(std::get<Cut>(lhs.at(a.id)).channel == 0);
}

TEST_CASE("CutSet resolves cut properties uniformly") {
    const Cut a = make_cut(dummy_features(), 0.0, 2.0);
    Cut b = make_cut(dummy_features(), 5.0, 3.0);
    b.supervisions = {make_supervision("s", 5.0, 1.0)};
    const MixedCut m = a.overlay(b, 0.5);
    const CutSet cuts({a, b, m});

    REQUIRE(cuts.duration(a.id) == Approx(2.0));
    REQUIRE(cuts.duration(m.id) == Approx(3.5));
    REQUIRE(cuts.supervisions(a.id).empty());
    REQUIRE(cuts.supervisions(m.id).size() == 1);
    REQUIRE_THROWS_AS(cuts.duration("nope"), UnresolvedReferenceError);
}

TEST_CASE("Mixes only resolve after binding to their source set") {
    test_support::TempPath store(".sqlite");
    const auto fa = store_constant_features(store.str(), "a", "a", 0, 1.0, 1.0f);
    const auto fb = store_constant_features(store.str(), "b", "b", 0, 1.0, 2.0f);
    const Cut a = make_cut(fa, 0.0, 1.0);
    const Cut b = make_cut(fb, 0.0, 1.0);
    const CutSet sources({a, b});

    const MixedCut mix = a.overlay(b);
    CutSet mixes({mix});
    REQUIRE_FALSE(mixes.has_external_source());
    REQUIRE_THROWS_AS(mixes.load_features(mix.id), UnresolvedReferenceError);
    REQUIRE_THROWS_AS(mixes.duration(mix.id), UnresolvedReferenceError);

    CutSet& bound = mixes.with_source_cuts_from(sources);
    REQUIRE(&bound == &mixes);
    REQUIRE(mixes.has_external_source());
    REQUIRE(&mixes.source() == &sources);

    const FeatureMatrix m = mixes.load_features(mix.id);
    REQUIRE(m.numFrames == 100);
    REQUIRE(m.at(0, 0) == Approx(3.0f));
    REQUIRE(mixes.duration(mix.id) == Approx(1.0));

    // Binding again is harmless; binding to itself restores self-resolution.
    mixes.with_source_cuts_from(sources);
    REQUIRE(mixes.duration(mix.id) == Approx(1.0));
    mixes.with_source_cuts_from(mixes);
    REQUIRE_FALSE(mixes.has_external_source());
    REQUIRE_THROWS_AS(mixes.duration(mix.id), UnresolvedReferenceError);
}

TEST_CASE("A union of sources and mixes resolves against itself") {
    test_support::TempPath store(".sqlite");
    const auto fa = store_constant_features(store.str(), "a", "a", 0, 1.0, 1.0f);
    const auto fb = store_constant_features(store.str(), "b", "b", 0, 2.0, 2.0f);
    const Cut a = make_cut(fa, 0.0, 1.0);
    const Cut b = make_cut(fb, 0.0, 2.0);
    const MixedCut mix = a.append(b);

    const CutSet all = CutSet({a, b}) + CutSet({mix});
    REQUIRE(all.duration(mix.id) == Approx(3.0));
    REQUIRE(all.load_features(mix.id).numFrames == 300);
    REQUIRE(all.load_features(a.id).numFrames == 100);
}

TEST_CASE("Bindings chain through an intermediate stage") {
    test_support::TempPath store(".sqlite");
    const auto fa = store_constant_features(store.str(), "a", "a", 0, 2.0, 1.0f);
    const auto fb = store_constant_features(store.str(), "b", "b", 0, 2.0, 2.0f);
    const auto fc = store_constant_features(store.str(), "c", "c", 0, 1.0, 4.0f);
    Cut a = make_cut(fa, 0.0, 2.0);
    const Cut b = make_cut(fb, 0.0, 2.0);
    Cut c = make_cut(fc, 0.0, 1.0);
    a.supervisions = {make_supervision("a1", 0.0, 1.0)};
    c.supervisions = {make_supervision("c1", 0.0, 1.0)};

    const CutSet stage0({a, b, c});
    const MixedCut ab = a.overlay(b);
    CutSet stage1({ab, c});
    stage1.with_source_cuts_from(stage0);
    REQUIRE(stage1.duration(ab.id) == Approx(2.0));

    const MixedCut abc = ab.append(c, stage0);
    CutSet stage2({abc});
    stage2.with_source_cuts_from(stage1);

    REQUIRE(stage2.duration(abc.id) == Approx(3.0));
    const auto sups = stage2.supervisions(abc.id);
    REQUIRE(sups.size() == 2);
    REQUIRE(sups[0].id == "a1");
    REQUIRE(sups[1].id == "c1");

    const FeatureMatrix m = stage2.load_features(abc.id);
    REQUIRE(m.numFrames == 300);
    REQUIRE(m.at(10, 0) == Approx(3.0f));
    REQUIRE(m.at(250, 0) == Approx(4.0f));
}

TEST_CASE("Union keeps the bindings of its operands") {
    test_support::TempPath store(".sqlite");
    const auto fa = store_constant_features(store.str(), "a", "a", 0, 2.0, 1.0f);
    const auto fb = store_constant_features(store.str(), "b", "b", 0, 2.0, 2.0f);
    const auto fc = store_constant_features(store.str(), "c", "c", 0, 1.0, 4.0f);
    const Cut a = make_cut(fa, 0.0, 2.0);
    const Cut b = make_cut(fb, 0.0, 2.0);
    const Cut c = make_cut(fc, 0.0, 1.0);
    const CutSet sources({a, b});
    const MixedCut ab = a.overlay(b);

    CutSet mixes({ab});
    mixes.with_source_cuts_from(sources);
    const CutSet merged = mixes + CutSet({c});

    REQUIRE_FALSE(merged.has_external_source());
    REQUIRE(&merged.source_for(ab.id) == &sources);
    REQUIRE(&merged.source_for(c.id) == &merged);
    REQUIRE(merged.duration(ab.id) == Approx(2.0));
    REQUIRE(merged.load_features(ab.id).at(0, 0) == Approx(3.0f));
    REQUIRE(merged.load_features(c.id).numFrames == 100);

    // A mix bound to one of the operands resolves against the union.
    const CutSet joined = sources + mixes;
    REQUIRE(&joined.source_for(ab.id) == &joined);
    REQUIRE(joined.duration(ab.id) == Approx(2.0));

    // Rebinding the whole set replaces the carried binding.
    CutSet rebound = merged;
    rebound.with_source_cuts_from(rebound);
    REQUIRE_THROWS_AS(rebound.duration(ab.id), UnresolvedReferenceError);
}
