#include "TestUtils.hpp"
#include "engine/SourcePoller.hpp"
#include "remote/DelegatingSessionFactory.hpp"
#include "rotation/RotatingServerAdvice.hpp"
#include "rotation/StandardRotationPolicy.hpp"
#include "utils/Error.hpp"

#include <memory>
#include <string>
#include <vector>

#include <doctest/doctest.h>

namespace
{

using tf::rotation::KeyDirectory;

class RecordingPolicy final : public tf::rotation::RotationPolicy
{
  public:
    void before_receive(tf::remote::MessageSource &) override { ++befores; }
    void after_receive(bool received, tf::remote::MessageSource &) override
    {
        outcomes.push_back(received);
    }

    int befores = 0;
    std::vector<bool> outcomes;
};

class VetoAdvice final : public tf::engine::MessageSourceAdvice
{
  public:
    bool before_receive(tf::remote::MessageSource &) override { return false; }
    std::optional<tf::remote::Message>
    after_receive(std::optional<tf::remote::Message> result,
                  tf::remote::MessageSource &) override
    {
        return result;
    }
};

} // namespace

TEST_CASE("rotating advice never suppresses a poll")
{
    auto policy = std::make_shared<RecordingPolicy>();
    tf::rotation::RotatingServerAdvice advice(policy);
    tf::tests::ScriptedSource source;

    CHECK(advice.before_receive(source));
    CHECK(advice.before_receive(source));
    CHECK(policy->befores == 2);
}

TEST_CASE("rotating advice forwards the outcome and passes the result through")
{
    auto policy = std::make_shared<RecordingPolicy>();
    tf::rotation::RotatingServerAdvice advice(policy);
    tf::tests::ScriptedSource source;

    tf::remote::Message message;
    message.file_name = "report.csv";
    auto passed = advice.after_receive(message, source);
    REQUIRE(passed.has_value());
    CHECK(passed->file_name == "report.csv");

    CHECK_FALSE(advice.after_receive(std::nullopt, source).has_value());
    CHECK(policy->outcomes == std::vector<bool>{true, false});
}

TEST_CASE("rotating advice rejects a null policy")
{
    CHECK_THROWS_AS(tf::rotation::RotatingServerAdvice(
                        std::shared_ptr<tf::rotation::RotationPolicy>()),
                    tf::ConfigurationError);
}

TEST_CASE("convenience constructor builds a greedy standard policy")
{
    tf::remote::DelegatingSessionFactory factory(
        tf::remote::DelegatingSessionFactory::FactoryMap{});
    tf::rotation::RotatingServerAdvice advice(
        &factory, std::vector<KeyDirectory>{{"A", "/a"}, {"B", "/b"}});
    auto *standard = dynamic_cast<tf::rotation::StandardRotationPolicy *>(
        &advice.policy());
    REQUIRE(standard != nullptr);
    CHECK_FALSE(standard->fair());
    CHECK(standard->entries().size() == 2);
}

TEST_CASE("poller drives the rotation through the advice chain")
{
    tf::remote::DelegatingSessionFactory factory(
        tf::remote::DelegatingSessionFactory::FactoryMap{});
    std::vector<std::string> applied;
    auto policy = std::make_shared<tf::rotation::StandardRotationPolicy>(
        &factory, std::vector<KeyDirectory>{{"A", "/in/a"}, {"B", "/in/b"}},
        false,
        [&applied](std::string const &directory, tf::remote::MessageSource &)
        { applied.push_back(directory); });
    auto advice = std::make_shared<tf::rotation::RotatingServerAdvice>(policy);

    // A yields one message then goes quiet; B yields one.
    tf::tests::ScriptedSource source({true, false, true});
    std::vector<std::string> handled;
    tf::engine::SourcePoller poller(
        &source, {advice},
        [&handled](tf::remote::Message const &message)
        { handled.push_back(message.file_name); });

    CHECK(poller.poll_once() == 1);
    CHECK(policy->position() == 0);
    CHECK(poller.poll_once() == 0);
    CHECK(policy->position() == 1);
    CHECK(poller.poll_once() == 1);
    CHECK(policy->position() == 1);

    CHECK(applied == std::vector<std::string>{"/in/a", "/in/a", "/in/b"});
    CHECK(handled.size() == 2);
    CHECK(poller.total_received() == 2);
}

TEST_CASE("poller stops a multi-message poll at the first empty receive")
{
    auto policy = std::make_shared<RecordingPolicy>();
    auto advice = std::make_shared<tf::rotation::RotatingServerAdvice>(policy);
    tf::tests::ScriptedSource source({true, true, false, true});
    tf::engine::SourcePoller::Options options;
    options.max_messages_per_poll = 10;
    tf::engine::SourcePoller poller(&source, {advice}, {}, options);

    CHECK(poller.poll_once() == 2);
    CHECK(source.receives == 3);
    CHECK(policy->outcomes == std::vector<bool>{true, true, false});
}

TEST_CASE("a vetoing advice skips the receive but rotation still ran first")
{
    auto policy = std::make_shared<RecordingPolicy>();
    auto rotating = std::make_shared<tf::rotation::RotatingServerAdvice>(policy);
    tf::tests::ScriptedSource source({true});
    tf::engine::SourcePoller poller(
        &source, {rotating, std::make_shared<VetoAdvice>()}, {});

    CHECK(poller.poll_once() == 0);
    CHECK(source.receives == 0);
    CHECK(policy->befores == 1);
}

TEST_CASE("poller rejects missing collaborators")
{
    tf::tests::ScriptedSource source;
    CHECK_THROWS_AS(tf::engine::SourcePoller(nullptr, {}, {}),
                    tf::ConfigurationError);
    CHECK_THROWS_AS(
        tf::engine::SourcePoller(
            &source,
            std::vector<std::shared_ptr<tf::engine::MessageSourceAdvice>>{
                nullptr},
            {}),
        tf::ConfigurationError);
}
