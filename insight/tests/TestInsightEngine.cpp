/**
 * @file TestInsightEngine.cpp
 * @brief Unit tests for insight ranking and feedback handling.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "InsightFixtures.hpp"
#include "tpo/insight/InsightEngine.hpp"

namespace tpo::insight {

using Catch::Matchers::WithinRel;

namespace {

const core::Date kToday = test::day(60);

Insight candidate(std::string key, double raw, core::usize n, double consistency, core::i32 age = 0)
{
    Insight i;
    i.type        = InsightType::kPattern;
    i.title       = key;
    i.signature   = makeSignature(InsightType::kPattern, key);
    i.rawScore    = raw;
    i.sampleSize  = n;
    i.consistency = consistency;
    i.observedAt  = core::addDays(kToday, -age);
    return i;
}

class FixedDetector final : public IInsightDetector
{
public:
    explicit FixedDetector(std::vector<Insight> insights) : _insights{std::move(insights)} {}
    std::vector<Insight> detect(const InsightContext &) const override { return _insights; }
    const char *name() const noexcept override { return "FixedDetector"; }

private:
    std::vector<Insight> _insights;
};

InsightEngine engineWith(std::vector<Insight> insights)
{
    InsightEngine engine;
    engine.addDetector(std::make_unique<FixedDetector>(std::move(insights)));
    return engine;
}

} // namespace

TEST_CASE("insight confidence and priority", "[insight][score]")
{
    REQUIRE(insightConfidence(10, 0.8) == core::ConfidenceLabel::kHigh);
    REQUIRE(insightConfidence(10, 0.7) == core::ConfidenceLabel::kModerate);
    REQUIRE(insightConfidence(6, 0.6) == core::ConfidenceLabel::kModerate);
    REQUIRE(insightConfidence(5, 1.0) == core::ConfidenceLabel::kLow);
    REQUIRE(insightConfidence(3, 0.0) == core::ConfidenceLabel::kLow);
    REQUIRE(insightConfidence(2, 1.0) == core::ConfidenceLabel::kInsufficient);

    REQUIRE_THAT(insightPriority(100.0, core::ConfidenceLabel::kHigh, 0, 14.0), WithinRel(100.0, 1e-12));
    REQUIRE_THAT(insightPriority(100.0, core::ConfidenceLabel::kHigh, 14, 14.0), WithinRel(50.0, 1e-12));
    REQUIRE_THAT(insightPriority(80.0, core::ConfidenceLabel::kModerate, 0, 14.0), WithinRel(60.0, 1e-12));
    REQUIRE_THAT(insightPriority(100.0, core::ConfidenceLabel::kInsufficient, 0, 14.0), WithinRel(25.0, 1e-12));
    REQUIRE(makeSignature(InsightType::kFatigueWarning, "load_ratio") == "fatigue_warning:load_ratio");
}

TEST_CASE("generate ranks, deduplicates and truncates", "[insight][engine]")
{
    const auto engine = engineWith({
        candidate("weak", 100.0, 2, 1.0),          // insufficient: 25
        candidate("second", 80.0, 12, 0.9),        // 80
        candidate("top", 100.0, 12, 0.9),          // 100
        candidate("second", 40.0, 12, 0.9),        // duplicate, lower
        candidate("stale", 100.0, 12, 0.9, 28),    // 25
    });
    FeedbackLog feedback;
    const std::vector<session::Session> none;
    const auto context = test::contextFor(none, kToday);

    const auto all = engine.candidates(context);
    REQUIRE(all.size() == 5);

    const auto feed = engine.generate(context, feedback, InsightOptions{.topK = 3});
    REQUIRE(feed.size() == 3);
    REQUIRE(feed[0].signature == "pattern:top");
    REQUIRE(feed[1].signature == "pattern:second");
    REQUIRE_THAT(feed[1].priority, WithinRel(80.0, 1e-12));
    REQUIRE(feed[0].confidence == core::ConfidenceLabel::kHigh);
    // Tie at 25 goes to the more recent observation.
    REQUIRE(feed[2].signature == "pattern:weak");
    REQUIRE(feed[0].isNew);

    const auto full = engine.generate(context, feedback);
    REQUIRE(full.size() == 4);
    REQUIRE(full[3].signature == "pattern:stale");
}

TEST_CASE("dismissed insights stay hidden for the cooldown", "[insight][feedback]")
{
    const auto engine = engineWith({candidate("top", 100.0, 12, 0.9), candidate("other", 60.0, 12, 0.9)});
    FeedbackLog feedback;
    const std::vector<session::Session> none;
    auto context = test::contextFor(none, kToday);

    REQUIRE(feedback.record({"ath-1", "pattern:top", FeedbackAction::kDismiss, kToday}).has_value());

    auto feed = engine.generate(context, feedback);
    REQUIRE(feed.size() == 1);
    REQUIRE(feed[0].signature == "pattern:other");

    SECTION("other athletes are unaffected")
    {
        context.athlete.id = "ath-2";
        REQUIRE(engine.generate(context, feedback).size() == 2);
    }

    SECTION("the signature returns after 21 days")
    {
        context.today = core::addDays(kToday, 20);
        REQUIRE(engine.generate(context, feedback).size() == 1);
        context.today = core::addDays(kToday, 21);
        REQUIRE(engine.generate(context, feedback).size() == 2);
    }

    SECTION("a later save lifts the dismissal")
    {
        REQUIRE(feedback.record({"ath-1", "pattern:top", FeedbackAction::kSave, core::addDays(kToday, 1)}).has_value());
        feed = engine.generate(context, feedback);
        REQUIRE(feed.size() == 2);
        REQUIRE_FALSE(feed[0].isNew);
        REQUIRE(feed[1].isNew);
    }
}

TEST_CASE("feedback log validates and filters by athlete", "[insight][feedback]")
{
    FeedbackLog feedback;
    REQUIRE(feedback.record({"", "pattern:top", FeedbackAction::kSave, kToday}).error().code()
            == core::ErrorCode::kInvalidArgument);
    REQUIRE(feedback.record({"ath-1", "", FeedbackAction::kSave, kToday}).error().code()
            == core::ErrorCode::kInvalidArgument);

    REQUIRE(feedback.record({"ath-1", "trend:efficiency_up", FeedbackAction::kSave, kToday}).has_value());
    REQUIRE(feedback.record({"ath-2", "trend:efficiency_up", FeedbackAction::kDismiss, kToday}).has_value());

    REQUIRE(feedback.events("ath-1").size() == 1);
    REQUIRE(feedback.isSaved("ath-1", "trend:efficiency_up"));
    REQUIRE_FALSE(feedback.isSaved("ath-2", "trend:efficiency_up"));
    REQUIRE(feedback.isSuppressed("ath-2", "trend:efficiency_up", kToday, 21));
    REQUIRE_FALSE(feedback.isSuppressed("ath-1", "trend:efficiency_up", kToday, 21));
}

TEST_CASE("standard engine runs the built-in detectors", "[insight][engine]")
{
    const auto engine = InsightEngine::standard();
    REQUIRE(engine.detectorCount() == 5);

    FeedbackLog feedback;
    const std::vector<session::Session> none;
    REQUIRE(generateInsights(test::contextFor(none, kToday), feedback).empty());

    std::vector<session::Session> sessions;
    for (core::i32 d = 0; d < 28; ++d)
        sessions.push_back(test::run(d, 8.0, std::nullopt, session::SessionType::kEasy, d < 21 ? 50.0 : 150.0));
    const auto feed = generateInsights(test::contextFor(sessions, test::day(27)), feedback);
    REQUIRE(test::findSignature(feed, "fatigue_warning:load_ratio") != nullptr);
}

} // namespace tpo::insight
