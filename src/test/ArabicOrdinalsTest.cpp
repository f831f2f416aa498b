#include <cassert>
#include <iostream>
#include <regex>
#include <set>

#include "domain/ArabicOrdinals.hpp"

using lexingest::domain::ArabicOrdinals;

int main() {
    std::cout << "[Test] Starting ArabicOrdinals Test..." << std::endl;

    const auto& table = ArabicOrdinals::Table();
    assert(table.size() == 119 && "Table should cover 1..109 and 200..209.");

    std::set<int> values;
    for (const auto& [phrase, value] : table) {
        assert(!phrase.empty());
        assert(ArabicOrdinals::ToNumber(phrase) == value);
        values.insert(value);
    }
    assert(values.size() == table.size() && "Every phrase maps to a distinct numeral.");
    for (int n = 1; n <= 109; ++n) assert(values.count(n) == 1);
    for (int n = 200; n <= 209; ++n) assert(values.count(n) == 1);

    std::cout << "[Test] Spot-checking phrases..." << std::endl;
    assert(ArabicOrdinals::ToNumber("الأولى") == 1);
    assert(ArabicOrdinals::ToNumber("العاشرة") == 10);
    assert(ArabicOrdinals::ToNumber("الحادية عشرة") == 11);
    assert(ArabicOrdinals::ToNumber("الثانية عشرة") == 12);
    assert(ArabicOrdinals::ToNumber("الثالثة والعشرون") == 23);
    assert(ArabicOrdinals::ToNumber("التسعون") == 90);
    assert(ArabicOrdinals::ToNumber("التاسعة والتسعون") == 99);
    assert(ArabicOrdinals::ToNumber("المائة") == 100);
    assert(ArabicOrdinals::ToNumber("الثانية بعد المائة") == 102);
    assert(ArabicOrdinals::ToNumber("المائتان") == 200);
    assert(ArabicOrdinals::ToNumber("الخامسة بعد المائتين") == 205);

    // Whitespace runs inside a phrase are tolerated.
    assert(ArabicOrdinals::ToNumber("  الثانية \n  عشرة ") == 12);
    assert(!ArabicOrdinals::ToNumber("الألف").has_value());
    assert(!ArabicOrdinals::ToNumber("").has_value());

    std::cout << "[Test] Phrase pattern reads whole phrases..." << std::endl;
    std::regex pattern("(" + ArabicOrdinals::PhrasePattern() + ")");
    std::smatch match;

    std::string teen = "المادة الثانية عشرة: نص";
    assert(std::regex_search(teen, match, pattern));
    assert(ArabicOrdinals::ToNumber(match[1].str()) == 12);

    std::string beyondTable = "المادة العاشرة بعد المائة: نص";
    assert(std::regex_search(beyondTable, match, pattern));
    assert(match[1].str() == "العاشرة بعد المائة");
    assert(!ArabicOrdinals::ToNumber(match[1].str()).has_value());

    // Every table phrase matches in full.
    for (const auto& entry : table) {
        std::string text = entry.first + ":";
        assert(std::regex_search(text, match, pattern));
        assert(match.position(0) == 0 && match[1].str() == entry.first);
    }

    // A word that merely starts like an ordinal is not one.
    std::string glued = "الثانيةكذا";
    assert(!std::regex_search(glued, match, pattern));

    std::cout << "[PASS] ArabicOrdinals Test passed." << std::endl;
    return 0;
}
