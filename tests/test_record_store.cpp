#include <gtest/gtest.h>

#include "storage/record_store.h"
#include "test_fixtures.h"

#include <filesystem>
#include <fstream>

using namespace cinemap;
using json = nlohmann::json;

class RecordStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = "data/test_record_store";
        std::filesystem::create_directories(dir_);
        store_ = test::sampleStore();
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        const std::string path = dir_ + "/" + name;
        std::ofstream out(path, std::ios::trunc);
        out << content;
        return path;
    }

    std::string dir_;
    RecordStorePtr store_;
};

TEST_F(RecordStoreTest, GroupsRecordsIntoProductions) {
    ASSERT_EQ(store_->size(), 15u);
    EXPECT_EQ(store_->productionCount(), 8u);

    EXPECT_EQ(store_->production(0).label(), "Vertigo (1958)");
    EXPECT_EQ(store_->productionOf(2), 0u);
    EXPECT_EQ(store_->recordsOf(store_->productionOf(4)), (std::vector<size_t>{4, 5, 6}));

    auto rock = store_->findProduction(ProductionId{"The Rock", "1996"});
    ASSERT_TRUE(rock.has_value());
    EXPECT_EQ(store_->recordsOf(*rock), (std::vector<size_t>{9, 10}));
    EXPECT_FALSE(store_->findProduction(ProductionId{"The Rock", "1997"}).has_value());
}

TEST_F(RecordStoreTest, YearParsing) {
    EXPECT_EQ(store_->at(0).year.value_or(0), 1958);
    EXPECT_EQ(store_->at(0).year_text, "1958");
    EXPECT_FALSE(store_->at(14).year.has_value());
    // A production without a year is labelled by its title alone
    EXPECT_EQ(store_->production(store_->productionOf(14)).label(), "Street Scene");

    auto r = RecordStore::recordFromJson(json{{"Title", "Bullitt"}, {"Release Year", "1968.0"}}, 3);
    EXPECT_EQ(r.year.value_or(0), 1968);
    EXPECT_EQ(r.year_text, "1968");
    EXPECT_EQ(r.id, "3");

    auto bad = RecordStore::recordFromJson(json{{"Title", "X"}, {"Year", "1968.5"}}, 0);
    EXPECT_FALSE(bad.year.has_value());

    // Out of int range or not finite: absent, raw text kept
    auto huge = RecordStore::recordFromJson(json{{"Title", "Huge"}, {"Year", "99999999999"}}, 0);
    EXPECT_FALSE(huge.year.has_value());
    EXPECT_EQ(huge.year_text, "99999999999");

    auto exponent = RecordStore::recordFromJson(json{{"Title", "Exp"}, {"Year", "1e11"}}, 0);
    EXPECT_FALSE(exponent.year.has_value());
    EXPECT_EQ(exponent.year_text, "1e11");

    auto inf = RecordStore::recordFromJson(json{{"Title", "Inf"}, {"Year", "inf"}}, 0);
    EXPECT_FALSE(inf.year.has_value());
    EXPECT_EQ(inf.year_text, "inf");

    auto infinity = RecordStore::recordFromJson(json{{"Title", "Infinity"}, {"Year", "-infinity"}}, 0);
    EXPECT_FALSE(infinity.year.has_value());
}

TEST_F(RecordStoreTest, UnrepresentableYearsStayDistinctProductions) {
    auto [status, store] = RecordStore::fromJson(json::array({
        {{"Title", "Huge"}, {"Year", "99999999999"}, {"Locations", "Pier 39"}},
        {{"Title", "Inf"}, {"Year", "inf"}, {"Locations", "Fort Point"}}
    }));
    ASSERT_TRUE(status.ok) << status.message;
    EXPECT_EQ(store->productionCount(), 2u);
    EXPECT_EQ(store->production(0).label(), "Huge (99999999999)");
    EXPECT_EQ(store->production(1).label(), "Inf (inf)");
}

TEST_F(RecordStoreTest, DistinctLocationsSkipAbsentAndDuplicates) {
    const size_t mystic = store_->productionOf(4);
    EXPECT_EQ(store_->distinctLocationsOf(mystic), (std::vector<std::string>{"Pier 39", "Crissy Field"}));

    const size_t milk = store_->productionOf(7);
    EXPECT_EQ(store_->distinctLocationsOf(milk), (std::vector<std::string>{"Castro Theatre"}));
}

TEST_F(RecordStoreTest, LocationLookup) {
    EXPECT_TRUE(store_->isKnownLocation("Pier 39"));
    EXPECT_TRUE(store_->isKnownLocation("  Pier 39 "));
    EXPECT_FALSE(store_->isKnownLocation("None"));
    EXPECT_FALSE(store_->isKnownLocation("Mordor"));

    auto p = store_->locationPoint("Alcatraz Island");
    ASSERT_TRUE(p.has_value());
    EXPECT_DOUBLE_EQ(p->lon(), -122.4230);

    // Known location without any geometry
    EXPECT_TRUE(store_->isKnownLocation("Crissy Field"));
    EXPECT_FALSE(store_->locationPoint("Crissy Field").has_value());
    EXPECT_EQ(store_->locationRecord("Crissy Field").value_or(99), 5u);
}

TEST_F(RecordStoreTest, GeometryFallbacks) {
    auto latlon = RecordStore::recordFromJson(json{{"Title", "A"}, {"Lat", "37.8"}, {"Lon", -122.4}}, 0);
    ASSERT_TRUE(latlon.geometry.has_value());
    EXPECT_DOUBLE_EQ(latlon.geometry->lat(), 37.8);

    auto broken = RecordStore::recordFromJson(json{{"Title", "B"}, {"geometry", "nan"}}, 1);
    EXPECT_FALSE(broken.geometry.has_value());
}

TEST_F(RecordStoreTest, LoadJsonLines) {
    json rows = test::sampleRows();
    std::string content;
    for (const auto& r : rows) content += r.dump() + "\n";
    content += "\n";
    auto path = writeFile("locations.jsonl", content);

    auto [status, store] = RecordStore::loadFile(path);
    ASSERT_TRUE(status.ok) << status.message;
    EXPECT_EQ(store->size(), 15u);
    EXPECT_EQ(store->productionCount(), 8u);
}

TEST_F(RecordStoreTest, LoadJsonLinesReportsLine) {
    auto path = writeFile("broken.jsonl", "{\"Title\": \"A\"}\n{not json\n");
    auto [status, store] = RecordStore::loadFile(path);
    EXPECT_FALSE(status.ok);
    EXPECT_EQ(store, nullptr);
    EXPECT_NE(status.message.find(":2:"), std::string::npos);
}

TEST_F(RecordStoreTest, LoadFeatureCollection) {
    json fc = {{"type", "FeatureCollection"}, {"features", json::array()}};
    fc["features"].push_back({{"type", "Feature"},
                              {"geometry", test::point(-122.4230, 37.8270)},
                              {"properties", {{"Title", "The Rock"}, {"Year", 1996}, {"Locations", "Alcatraz Island"}}}});
    fc["features"].push_back({{"type", "Feature"},
                              {"geometry", nullptr},
                              {"properties", {{"Title", "The Rock"}, {"Year", 1996}, {"Locations", "Fairmont Hotel"}}}});
    auto path = writeFile("locations.geojson", fc.dump());

    auto [status, store] = RecordStore::loadFile(path);
    ASSERT_TRUE(status.ok) << status.message;
    ASSERT_EQ(store->size(), 2u);
    EXPECT_EQ(store->productionCount(), 1u);
    EXPECT_TRUE(store->at(0).geometry.has_value());
    EXPECT_FALSE(store->at(1).geometry.has_value());
}

TEST_F(RecordStoreTest, LoadRecordsObject) {
    json doc = {{"records", json::array({{{"Title", "Milk"}, {"Year", 2008}}})}};
    auto [status, store] = RecordStore::fromJson(doc);
    ASSERT_TRUE(status.ok);
    EXPECT_EQ(store->size(), 1u);
}

TEST_F(RecordStoreTest, RejectsUnusableDocuments) {
    EXPECT_FALSE(RecordStore::fromJson(json{{"foo", 1}}).first.ok);
    EXPECT_FALSE(RecordStore::fromJson(json::array({1, 2})).first.ok);
    EXPECT_FALSE(RecordStore::loadFile(dir_ + "/missing.json").first.ok);
}

TEST(RecordStoreFactoryTest, FromRecordsBuildsIndexes) {
    LocationRecord a;
    a.title = "Bullitt";
    a.year_text = "1968";
    a.year = 1968;
    a.locations = "Filbert Street";
    LocationRecord b = a;
    b.locations = "Taylor Street";

    RecordStorePtr store = RecordStore::fromRecords({a, b});
    ASSERT_NE(store, nullptr);
    EXPECT_EQ(store->size(), 2u);
    EXPECT_EQ(store->productionCount(), 1u);
    EXPECT_EQ(store->recordsOf(0), (std::vector<size_t>{0, 1}));
    EXPECT_TRUE(store->isKnownLocation("Taylor Street"));
}
