// =============================================================================
// Participant and Personal Attribution Tests
// =============================================================================

#include <gtest/gtest.h>
#include "credrank/participant.hpp"
#include "test_util.hpp"

#include <vector>

using namespace credrank;
using credrank_test::participant;
using credrank_test::participant_id;

class ParticipantTest : public ::testing::Test {
protected:
    void SetUp() override {
        alice = participant("alice", 2);
        bob = participant("bob", 1);
        carol = participant("carol", 3);
        participants = {alice, bob, carol};
        // (-inf,0) [0,10) [10,20) [20,inf)
        intervals = partition_intervals({0, 15}, 10);
    }

    Participant alice;
    Participant bob;
    Participant carol;
    std::vector<Participant> participants;
    IntervalSequence intervals;
};

TEST_F(ParticipantTest, HexRoundTrip) {
    ParticipantId id = participant_id(0xab);
    id.bytes[0] = 0x01;
    std::string hex = id.to_hex();
    EXPECT_EQ(hex, "010000000000000000000000000000ab");
    EXPECT_EQ(ParticipantId::from_hex(hex), id);
    EXPECT_EQ(ParticipantId::from_hex("010000000000000000000000000000AB"), id);
}

TEST_F(ParticipantTest, MalformedHexRejected) {
    EXPECT_THROW(ParticipantId::from_hex("abc"), InvalidArgumentError);
    EXPECT_THROW(ParticipantId::from_hex("zz0000000000000000000000000000ab"), InvalidArgumentError);
}

TEST_F(ParticipantTest, SortedById) {
    std::vector<Participant> sorted = sort_participants(participants);
    ASSERT_EQ(sorted.size(), 3u);
    EXPECT_EQ(sorted[0], bob);
    EXPECT_EQ(sorted[1], alice);
    EXPECT_EQ(sorted[2], carol);
}

TEST_F(ParticipantTest, DuplicatesRejected) {
    Participant same_id = participant("dave", 2);
    EXPECT_THROW(sort_participants({alice, same_id}), ParameterError);

    Participant same_address{alice.address, "alias", participant_id(9)};
    EXPECT_THROW(sort_participants({alice, same_address}), ParameterError);
}

// =============================================================================
// Personal attributions
// =============================================================================

TEST_F(ParticipantTest, LatestProportionAtIntervalStart) {
    PersonalAttributions attributions = {
        PersonalAttribution{alice.id, {AttributionRecipient{bob.id, {{0, 0.5}, {12, 0.25}}}}}};
    IndexedAttributions index(attributions, participants, intervals);

    EXPECT_DOUBLE_EQ(index.sum_proportions(alice.id, 0), 0.0);
    EXPECT_DOUBLE_EQ(index.sum_proportions(alice.id, 1), 0.5);
    // Change at t=12 takes effect from the interval starting at 20
    EXPECT_DOUBLE_EQ(index.sum_proportions(alice.id, 2), 0.5);
    EXPECT_DOUBLE_EQ(index.sum_proportions(alice.id, 3), 0.25);
    EXPECT_DOUBLE_EQ(index.sum_proportions(bob.id, 1), 0.0);

    auto recipients = index.recipients(alice.id, 1);
    ASSERT_EQ(recipients.size(), 1u);
    EXPECT_EQ(recipients[0].first, bob.id);
    EXPECT_DOUBLE_EQ(recipients[0].second, 0.5);
    EXPECT_TRUE(index.recipients(alice.id, 0).empty());
}

TEST_F(ParticipantTest, RecipientsOrderedById) {
    PersonalAttributions attributions = {PersonalAttribution{
        alice.id, {AttributionRecipient{carol.id, {{0, 0.2}}}, AttributionRecipient{bob.id, {{0, 0.3}}}}}};
    IndexedAttributions index(attributions, participants, intervals);

    auto recipients = index.recipients(alice.id, 2);
    ASSERT_EQ(recipients.size(), 2u);
    EXPECT_EQ(recipients[0].first, bob.id);
    EXPECT_EQ(recipients[1].first, carol.id);
    EXPECT_DOUBLE_EQ(index.sum_proportions(alice.id, 2), 0.5);
}

TEST_F(ParticipantTest, InvalidAttributionsRejected) {
    ParticipantId stranger = participant_id(42);

    PersonalAttributions unknown_from = {PersonalAttribution{stranger, {}}};
    EXPECT_THROW((void)IndexedAttributions(unknown_from, participants, intervals), ParameterError);

    PersonalAttributions unknown_to = {PersonalAttribution{alice.id, {AttributionRecipient{stranger, {}}}}};
    EXPECT_THROW((void)IndexedAttributions(unknown_to, participants, intervals), ParameterError);

    PersonalAttributions out_of_range = {
        PersonalAttribution{alice.id, {AttributionRecipient{bob.id, {{0, 1.5}}}}}};
    EXPECT_THROW((void)IndexedAttributions(out_of_range, participants, intervals), ParameterError);

    PersonalAttributions unordered = {
        PersonalAttribution{alice.id, {AttributionRecipient{bob.id, {{5, 0.1}, {5, 0.2}}}}}};
    EXPECT_THROW((void)IndexedAttributions(unordered, participants, intervals), ParameterError);

    PersonalAttributions duplicate = {PersonalAttribution{
        alice.id, {AttributionRecipient{bob.id, {{0, 0.1}}}, AttributionRecipient{bob.id, {{0, 0.1}}}}}};
    EXPECT_THROW((void)IndexedAttributions(duplicate, participants, intervals), ParameterError);

    PersonalAttributions oversubscribed = {PersonalAttribution{
        alice.id, {AttributionRecipient{bob.id, {{0, 0.6}}}, AttributionRecipient{carol.id, {{0, 0.6}}}}}};
    EXPECT_THROW((void)IndexedAttributions(oversubscribed, participants, intervals), ParameterError);
}
