#include <gtest/gtest.h>
#include <tally/ledger/event_store.h>

#include "common/test_helpers.h"

#include <filesystem>

using namespace tally;
using namespace tally::ledger;
using namespace std::chrono_literals;

class EventStoreTest : public ::testing::Test {
protected:
    static constexpr GuildId kGuild = 42;

    void SetUp() override {
        tempDir_ = tests::make_temp_dir("tally_events_test_");
        storage_ = std::make_unique<storage::StorageHandle>(
            tests::test_storage_config(tempDir_ / "ledger.db"));
        ASSERT_TRUE(storage_->acquire().has_value());
        store_ = std::make_unique<EventStore>(*storage_, clock_);
    }

    void TearDown() override {
        store_.reset();
        storage_.reset();
        std::filesystem::remove_all(tempDir_);
    }

    EventId contribute(const std::string& item, std::int64_t qty, GuildId guild = kGuild,
                       const std::string& category = "Tools") {
        auto id = store_->appendContribution({guild, 7, {category, item}, qty});
        EXPECT_TRUE(id.has_value());
        return id ? id.value() : 0;
    }

    EventId recordOverride(const std::string& item, std::int64_t newQty, GuildId guild = kGuild,
                           const std::string& category = "Tools") {
        NewQuantityChange change;
        change.guildId = guild;
        change.actorId = 9;
        change.key = {category, item};
        change.oldQuantity = 0;
        change.newQuantity = newQty;
        change.reason = "Stock count";
        auto id = store_->appendQuantityChange(change);
        EXPECT_TRUE(id.has_value());
        return id ? id.value() : 0;
    }

    std::vector<LedgerEvent> query(EventQuery q) {
        auto result = store_->queryEvents(q);
        EXPECT_TRUE(result.has_value());
        return result ? result.value() : std::vector<LedgerEvent>{};
    }

    std::filesystem::path tempDir_;
    tests::ManualClock clock_;
    std::unique_ptr<storage::StorageHandle> storage_;
    std::unique_ptr<EventStore> store_;
};

TEST_F(EventStoreTest, AppendContributionPersistsFields) {
    auto id = contribute("Rope", 5);
    ASSERT_GT(id, 0);

    auto fetched = store_->getEvent(EventKind::Contribution, id);
    ASSERT_TRUE(fetched.has_value());
    ASSERT_TRUE(fetched.value().has_value());

    const auto& c = std::get<ContributionEvent>(*fetched.value());
    EXPECT_EQ(c.id, id);
    EXPECT_EQ(c.guildId, kGuild);
    EXPECT_EQ(c.actorId, 7);
    EXPECT_EQ(c.category, "Tools");
    EXPECT_EQ(c.itemName, "Rope");
    EXPECT_EQ(c.quantity, 5);
    EXPECT_EQ(toUnixMillis(c.createdAt), clock_.millis());
    EXPECT_EQ(c.sequence, 1);
}

TEST_F(EventStoreTest, QuantityChangeKeepsNotesAndReason) {
    NewQuantityChange change;
    change.guildId = kGuild;
    change.actorId = 3;
    change.key = {"Tools", "Rope"};
    change.oldQuantity = 12;
    change.newQuantity = 10;
    change.reason = "Recount";
    change.notes = "two frayed";

    auto id = store_->appendQuantityChange(change);
    ASSERT_TRUE(id.has_value());

    auto fetched = store_->getEvent(EventKind::QuantityChange, id.value(), kGuild);
    ASSERT_TRUE(fetched.has_value());
    ASSERT_TRUE(fetched.value().has_value());
    const auto& qc = std::get<QuantityChangeEvent>(*fetched.value());
    EXPECT_EQ(qc.oldQuantity, 12);
    EXPECT_EQ(qc.newQuantity, 10);
    EXPECT_EQ(qc.reason, "Recount");
    ASSERT_TRUE(qc.notes.has_value());
    EXPECT_EQ(*qc.notes, "two frayed");
    EXPECT_EQ(qc.actorId, 3);
}

TEST_F(EventStoreTest, RejectsOutOfRangeQuantities) {
    for (std::int64_t qty : {std::int64_t{0}, std::int64_t{-1}, kMaxQuantity + 1}) {
        auto result = store_->appendContribution({kGuild, 7, {"Tools", "Rope"}, qty});
        ASSERT_FALSE(result.has_value()) << qty;
        EXPECT_EQ(result.error().code, ErrorCode::InvalidQuantity);
    }

    auto maxed = store_->appendContribution({kGuild, 7, {"Tools", "Rope"}, kMaxQuantity});
    EXPECT_TRUE(maxed.has_value());

    NewQuantityChange negative;
    negative.guildId = kGuild;
    negative.key = {"Tools", "Rope"};
    negative.newQuantity = -3;
    negative.reason = "oops";
    auto result = store_->appendQuantityChange(negative);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidQuantity);
}

TEST_F(EventStoreTest, QuantityChangeRequiresReason) {
    NewQuantityChange change;
    change.guildId = kGuild;
    change.key = {"Tools", "Rope"};
    change.newQuantity = 4;
    change.reason = "   ";

    auto result = store_->appendQuantityChange(change);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::MissingReason);

    auto events = query({kGuild});
    EXPECT_TRUE(events.empty());
}

TEST_F(EventStoreTest, RequiresItemAndCategory) {
    auto noItem = store_->appendContribution({kGuild, 7, {"Tools", ""}, 1});
    ASSERT_FALSE(noItem.has_value());
    EXPECT_EQ(noItem.error().code, ErrorCode::InvalidArgument);

    auto noCategory = store_->appendContribution({kGuild, 7, {"", "Rope"}, 1});
    ASSERT_FALSE(noCategory.has_value());
    EXPECT_EQ(noCategory.error().code, ErrorCode::InvalidArgument);
}

TEST_F(EventStoreTest, RejectsTextThatIsNotUtf8) {
    const std::string broken = "Rop\xff" "e";

    auto badItem = store_->appendContribution({kGuild, 7, {"Tools", broken}, 5});
    ASSERT_FALSE(badItem.has_value());
    EXPECT_EQ(badItem.error().code, ErrorCode::InvalidArgument);

    auto badCategory = store_->appendContribution({kGuild, 7, {"Too\xc3", "Rope"}, 5});
    ASSERT_FALSE(badCategory.has_value());
    EXPECT_EQ(badCategory.error().code, ErrorCode::InvalidArgument);

    NewQuantityChange change;
    change.guildId = kGuild;
    change.actorId = 9;
    change.key = {"Tools", "Rope"};
    change.newQuantity = 3;
    change.reason = "Recount \xed\xa0\x80";
    auto badReason = store_->appendQuantityChange(change);
    ASSERT_FALSE(badReason.has_value());
    EXPECT_EQ(badReason.error().code, ErrorCode::InvalidArgument);

    change.reason = "Recount";
    change.notes = std::string("\xc0\xaf");
    auto badNotes = store_->appendQuantityChange(change);
    ASSERT_FALSE(badNotes.has_value());
    EXPECT_EQ(badNotes.error().code, ErrorCode::InvalidArgument);

    EXPECT_TRUE(query({kGuild}).empty());
}

TEST_F(EventStoreTest, MultibyteNamesMatchExactly) {
    contribute("\xc3\x89p\xc3\xa9" "e", 2, kGuild, "Armes");  // "Épée"
    contribute("Epee", 4, kGuild, "Armes");

    auto accented = store_->contributionsFor(kGuild, {"Armes", "\xc3\x89p\xc3\xa9" "e"});
    ASSERT_TRUE(accented.has_value());
    ASSERT_EQ(accented.value().size(), 1u);
    EXPECT_EQ(accented.value()[0].quantity, 2);
}

TEST_F(EventStoreTest, SameTimestampEventsOrderByInsertion) {
    auto first = contribute("Rope", 5);
    auto second = recordOverride("Rope", 2);
    auto third = contribute("Rope", 1);

    auto events = query({kGuild});
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(idOf(events[0]), first);
    EXPECT_EQ(kindOf(events[0]), EventKind::Contribution);
    EXPECT_EQ(idOf(events[1]), second);
    EXPECT_EQ(kindOf(events[1]), EventKind::QuantityChange);
    EXPECT_EQ(idOf(events[2]), third);
    EXPECT_LT(sequenceOf(events[0]), sequenceOf(events[1]));
    EXPECT_LT(sequenceOf(events[1]), sequenceOf(events[2]));
}

TEST_F(EventStoreTest, TimestampTakesPrecedenceOverInsertionOrder) {
    const auto base = clock_.millis();
    clock_.set(base + 5000);
    auto later = contribute("Rope", 5);
    clock_.set(base);
    auto earlier = recordOverride("Rope", 1);

    auto events = query({kGuild});
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(idOf(events[0]), earlier);
    EXPECT_EQ(idOf(events[1]), later);
}

TEST_F(EventStoreTest, LimitKeepsMostRecentInAscendingOrder) {
    std::vector<EventId> ids;
    for (int i = 0; i < 6; ++i) {
        ids.push_back(i % 2 == 0 ? contribute("Rope", i + 1) : recordOverride("Rope", i));
        clock_.advance(1s);
    }

    EventQuery q{kGuild};
    q.limit = 3;
    auto events = query(q);
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(idOf(events[0]), ids[3]);
    EXPECT_EQ(idOf(events[1]), ids[4]);
    EXPECT_EQ(idOf(events[2]), ids[5]);
    EXPECT_TRUE(chronologicallyBefore(events[0], events[1]));
    EXPECT_TRUE(chronologicallyBefore(events[1], events[2]));

    q.limit = 0;
    EXPECT_TRUE(query(q).empty());

    q.limit = 100;
    EXPECT_EQ(query(q).size(), 6u);
}

TEST_F(EventStoreTest, FiltersByItemCategoryGuildAndTime) {
    contribute("Rope", 5);
    clock_.advance(1s);
    const auto cutoff = clock_();
    contribute("Rope", 3, kGuild, "Misc");
    clock_.advance(1s);
    contribute("Lantern", 1);
    contribute("Rope", 9, kGuild + 1);

    EventQuery byItem{kGuild};
    byItem.itemName = "Rope";
    EXPECT_EQ(query(byItem).size(), 2u);

    byItem.category = "Misc";
    auto misc = query(byItem);
    ASSERT_EQ(misc.size(), 1u);
    EXPECT_EQ(itemKeyOf(misc[0]).category, "Misc");

    EventQuery asOf{kGuild};
    asOf.asOf = cutoff;
    EXPECT_EQ(query(asOf).size(), 2u);

    EventQuery other{kGuild + 1};
    EXPECT_EQ(query(other).size(), 1u);

    EventQuery contributionsOnly{kGuild};
    recordOverride("Rope", 4);
    contributionsOnly.includeQuantityChanges = false;
    EXPECT_EQ(query(contributionsOnly).size(), 3u);
}

TEST_F(EventStoreTest, ContributionsForItemKey) {
    auto a = contribute("Rope", 5);
    contribute("Rope", 3, kGuild, "Misc");
    auto b = contribute("Rope", 2);

    auto rows = store_->contributionsFor(kGuild, {"Tools", "Rope"});
    ASSERT_TRUE(rows.has_value());
    ASSERT_EQ(rows.value().size(), 2u);
    EXPECT_EQ(rows.value()[0].id, a);
    EXPECT_EQ(rows.value()[1].id, b);
}

TEST_F(EventStoreTest, QuantityChangeHistoryIsNewestFirst) {
    auto first = recordOverride("Rope", 3);
    clock_.advance(1s);
    auto misc = recordOverride("Rope", 8, kGuild, "Misc");
    clock_.advance(1s);
    auto latest = recordOverride("Rope", 1);

    auto all = store_->quantityChangeHistory(kGuild, "Rope");
    ASSERT_TRUE(all.has_value());
    ASSERT_EQ(all.value().size(), 3u);
    EXPECT_EQ(all.value()[0].id, latest);
    EXPECT_EQ(all.value()[1].id, misc);
    EXPECT_EQ(all.value()[2].id, first);

    auto tools = store_->quantityChangeHistory(kGuild, "Rope", std::string("Tools"));
    ASSERT_TRUE(tools.has_value());
    ASSERT_EQ(tools.value().size(), 2u);
    EXPECT_EQ(tools.value()[0].id, latest);
}

TEST_F(EventStoreTest, GetEventHonoursGuildScope) {
    auto id = contribute("Rope", 5);

    auto wrongGuild = store_->getEvent(EventKind::Contribution, id, kGuild + 1);
    ASSERT_TRUE(wrongGuild.has_value());
    EXPECT_FALSE(wrongGuild.value().has_value());

    auto wrongKind = store_->getEvent(EventKind::QuantityChange, id);
    ASSERT_TRUE(wrongKind.has_value());
    EXPECT_FALSE(wrongKind.value().has_value());
}

TEST_F(EventStoreTest, DeleteEvent) {
    auto id = contribute("Rope", 5);

    auto otherGuild = store_->deleteEvent(EventKind::Contribution, id, kGuild + 1);
    ASSERT_TRUE(otherGuild.has_value());
    EXPECT_FALSE(otherGuild.value());

    auto removed = store_->deleteEvent(EventKind::Contribution, id, kGuild);
    ASSERT_TRUE(removed.has_value());
    EXPECT_TRUE(removed.value());

    auto again = store_->deleteEvent(EventKind::Contribution, id);
    ASSERT_TRUE(again.has_value());
    EXPECT_FALSE(again.value());

    EXPECT_TRUE(query({kGuild}).empty());
}

TEST_F(EventStoreTest, BulkDeleteReportsEachOutcome) {
    auto c1 = contribute("Rope", 5);
    auto c2 = contribute("Lantern", 2);
    auto q1 = recordOverride("Rope", 1);

    std::vector<EventRef> refs{{EventKind::Contribution, c1},
                               {EventKind::QuantityChange, q1},
                               {EventKind::Contribution, 9999},
                               {EventKind::QuantityChange, c2 + 1000}};
    auto report = store_->deleteEvents(refs, kGuild);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report.value().contributionsRemoved, 1u);
    EXPECT_EQ(report.value().quantityChangesRemoved, 1u);
    EXPECT_EQ(report.value().totalRemoved(), 2u);
    ASSERT_EQ(report.value().outcomes.size(), 4u);
    EXPECT_TRUE(report.value().outcomes[0].removed);
    EXPECT_TRUE(report.value().outcomes[1].removed);
    EXPECT_FALSE(report.value().outcomes[2].removed);
    EXPECT_NE(report.value().outcomes[2].error.find("not found"), std::string::npos);

    auto remaining = query({kGuild});
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(idOf(remaining[0]), c2);
}

TEST(EventKindTest, ParsesNamesAndAliases) {
    EXPECT_EQ(parseEventKind("contribution"), EventKind::Contribution);
    EXPECT_EQ(parseEventKind("quantity_change"), EventKind::QuantityChange);
    EXPECT_EQ(parseEventKind("override"), EventKind::QuantityChange);
    EXPECT_FALSE(parseEventKind("archive").has_value());
    EXPECT_STREQ(toString(EventKind::QuantityChange), "quantity_change");
}

TEST(Utf8ValidationTest, AcceptsWellFormedText) {
    EXPECT_TRUE(isValidUtf8(""));
    EXPECT_TRUE(isValidUtf8("Rope"));
    EXPECT_TRUE(isValidUtf8("\xc3\xa9"));             // U+00E9
    EXPECT_TRUE(isValidUtf8("\xe7\x81\xab"));         // U+706B
    EXPECT_TRUE(isValidUtf8("\xf0\x9f\x94\xa5"));     // U+1F525
    EXPECT_TRUE(isValidUtf8("\xf4\x8f\xbf\xbf"));     // U+10FFFF
}

TEST(Utf8ValidationTest, RejectsMalformedSequences) {
    EXPECT_FALSE(isValidUtf8("\xff"));
    EXPECT_FALSE(isValidUtf8("\x80"));                 // stray continuation
    EXPECT_FALSE(isValidUtf8("\xc3"));                 // truncated
    EXPECT_FALSE(isValidUtf8("\xc0\xaf"));             // overlong '/'
    EXPECT_FALSE(isValidUtf8("\xe0\x80\xaf"));         // overlong
    EXPECT_FALSE(isValidUtf8("\xed\xa0\x80"));         // surrogate U+D800
    EXPECT_FALSE(isValidUtf8("\xf4\x90\x80\x80"));     // past U+10FFFF
    EXPECT_FALSE(isValidUtf8("\xe7\x81" "A"));       // bad continuation
}
