#pragma once

#include "storage/record_store.h"

#include <stdexcept>
#include <nlohmann/json.hpp>

namespace cinemap {
namespace test {

inline nlohmann::json point(double lon, double lat) {
    return {{"type", "Point"}, {"coordinates", {lon, lat}}};
}

inline nlohmann::json row(int id, const char* title, nlohmann::json year, const char* location,
                          const char* director, const char* writer,
                          const char* a1, const char* a2, const char* a3,
                          nlohmann::json geometry) {
    return {
        {"id", id}, {"Title", title}, {"Year", std::move(year)}, {"Locations", location},
        {"Fun Facts", ""}, {"Director", director}, {"Writer", writer},
        {"Actor 1", a1}, {"Actor 2", a2}, {"Actor 3", a3}, {"geometry", std::move(geometry)}
    };
}

// 15 records, 8 productions.
//  0-2  Vertigo (1958)            Hitchcock; Stewart, Novak, Bel Geddes
//  3    The Birds (1963)          Hitchcock; near Union Square
//  4-6  Mystic River (2003)       Sean Penn; 5 has no geometry, 6 repeats "Pier 39"
//  7-8  Milk (2008)               Sean Penn; 8 has location "None"
//  9-10 The Rock (1996)           Connery, Cage
//  11   The Maltese Falcon (1941) Bogart; near Union Square
//  12-13 Dark Passage (1947)      Bogart, Bacall, "nan"
//  14   Street Scene (year None)  all people absent, no geometry
inline nlohmann::json sampleRows() {
    using nlohmann::json;
    json rows = json::array();
    rows.push_back(row(0, "Vertigo", 1958, "Fort Point", "Alfred Hitchcock", "Alec Coppel",
                       "James Stewart", "Kim Novak", "Barbara Bel Geddes", point(-122.4770, 37.8106)));
    rows.push_back(row(1, "Vertigo", 1958, "Mission Dolores", "Alfred Hitchcock", "Alec Coppel",
                       "James Stewart", "Kim Novak", "Barbara Bel Geddes", point(-122.4270, 37.7644)));
    rows.push_back(row(2, "Vertigo", 1958, "Palace of Fine Arts", "Alfred Hitchcock", "Alec Coppel",
                       "James Stewart", "Kim Novak", "Barbara Bel Geddes", point(-122.4484, 37.8029)));
    rows.push_back(row(3, "The Birds", 1963, "Union Square (St. Francis Hotel)", "Alfred Hitchcock", "Evan Hunter",
                       "Tippi Hedren", "Rod Taylor", "Suzanne Pleshette", point(-122.4075, 37.7880)));
    rows.push_back(row(4, "Mystic River", 2003, "Pier 39", "Clint Eastwood", "Brian Helgeland",
                       "Sean Penn", "Tim Robbins", "Kevin Bacon", point(-122.4098, 37.8087)));
    rows.push_back(row(5, "Mystic River", 2003, "Crissy Field", "Clint Eastwood", "Brian Helgeland",
                       "Sean Penn", "Tim Robbins", "Kevin Bacon", nullptr));
    rows.push_back(row(6, "Mystic River", 2003, "Pier 39", "Clint Eastwood", "Brian Helgeland",
                       "Sean Penn", "Tim Robbins", "Kevin Bacon", point(-122.4098, 37.8087)));
    rows.push_back(row(7, "Milk", 2008, "Castro Theatre", "Gus Van Sant", "Dustin Lance Black",
                       "Sean Penn", "Emile Hirsch", "Josh Brolin", point(-122.4348, 37.7620)));
    rows.push_back(row(8, "Milk", 2008, "None", "Gus Van Sant", "Dustin Lance Black",
                       "Sean Penn", "Emile Hirsch", "Josh Brolin", nullptr));
    rows.push_back(row(9, "The Rock", 1996, "Alcatraz Island", "Michael Bay", "David Weisberg",
                       "Sean Connery", "Nicolas Cage", "Ed Harris", point(-122.4230, 37.8270)));
    rows.push_back(row(10, "The Rock", 1996, "Fairmont Hotel", "Michael Bay", "David Weisberg",
                       "Sean Connery", "Nicolas Cage", "Ed Harris", point(-122.4100, 37.7924)));
    rows.push_back(row(11, "The Maltese Falcon", 1941, "Burritt Alley", "John Huston", "John Huston",
                       "Humphrey Bogart", "Mary Astor", "Peter Lorre", point(-122.4075, 37.7896)));
    rows.push_back(row(12, "Dark Passage", 1947, "Filbert Steps", "Delmer Daves", "Delmer Daves",
                       "Humphrey Bogart", "Lauren Bacall", "nan", point(-122.4036, 37.8050)));
    rows.push_back(row(13, "Dark Passage", 1947, "Golden Gate Bridge", "Delmer Daves", "Delmer Daves",
                       "Humphrey Bogart", "Lauren Bacall", "nan", point(-122.4786, 37.8199)));
    rows.push_back(row(14, "Street Scene", "None", "Market Street", "none", "NULL",
                       "", "  ", "None", nullptr));
    return rows;
}

inline RecordStorePtr sampleStore() {
    auto [status, store] = RecordStore::fromJson(sampleRows());
    if (!status.ok) {
        throw std::runtime_error("sample store: " + status.message);
    }
    return store;
}

} // namespace test
} // namespace cinemap
