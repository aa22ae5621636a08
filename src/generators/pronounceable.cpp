/**
 * Mnemo Pronounceable Words Implementation
 */

#include "pronounceable.hpp"
#include "../core/charsets.hpp"
#include "../core/secure_random.hpp"
#include "../core/text_utils.hpp"

#include <utility>

namespace mnemo {

namespace {

constexpr std::string_view VOWEL_SUFFIXES =
    "ing ers ance ence le ness ings ment ize ate ive ute acy ous ify "
    "ought some edness ed es ly less ment able ible les led ious ant "
    "ary iety ist ism ial ate act ure iac ice aint ent ant ure ide ify les";

constexpr std::string_view CONSONANT_SUFFIXES =
    "cked cker tor ter ly rer tic nst lyst onic ght nge nce zer cy ly "
    "ny lic dged red ate ndle ching tching lent ged zen ted nnial lic "
    "rly stic se les";

constexpr std::string_view T_SUFFIXES = "ion ity ient ment ance ly less ter tor";

constexpr std::string_view FAKE_PREFIXES =
    "a ab abso aca acri admini alpha ambi ana ant ante anti apro aqua "
    "archi astro atmo audi auto be bene beta beva bi bio centa chrono "
    "circum co co- com con contra counter credo cryo cyber cyclo de "
    "deca demo dextro di dia dicto dis double- duo dyna dyno dys e "
    "ecto ef endo entre equi euro every ex exo extra fa fan fict fiz "
    "flo fore fun gag gamma gap geo gig giga glyco goo gyro he hemi "
    "hetero hexa his holo homeo homo hosp hu hydro hyper hypo id "
    "identi ig imi in info infra int inter intra intro iso kilo kno "
    "la lacto li longi luma ma macro magni mali mega meso meta micro "
    "milli mini mis mono multi nano navi neo non non- novi octa octo "
    "omni otco over oxy pan para peda penta per peri philo phoni "
    "phono physi pico poly post pre pre- pro proto quad re retro "
    "sancti semi septo similli steno sub super supra synchro tele "
    "tera tetra thermo trans tre tri ultra un una under uni uno "
    "vario vita xantho xero";

constexpr std::string_view FAKE_SUFFIXES =
    "able ad aero alooza any ation be bi bio cate cede ceed cess "
    "eting fest fy gram graph iac ible ify ing ism ist ity ize log "
    "logue logy maniac ment meter metry ogram ograph oid ology "
    "ometer opath opsy osity phile phobe phobia phone super tion "
    "tious ty";

using Replacement = std::pair<std::string_view, std::string_view>;

constexpr Replacement PRONOUNCEABLE_CLEANUP[] = {
    {"aa", "a"}, {"hh", "h"}, {"ii", "i"}, {"jj", "j"},
    {"kk", "k"}, {"qq", "qu"}, {"uu", "u"}, {"vv", "v"},
    {"ww", "w"}, {"xx", "x"}, {"yy", "y"},
};

constexpr Replacement FAKE_WORD_CLEANUP[] = {
    {"aa", "a"}, {"ii", "i"}, {"hh", "h"}, {"jj", "j"},
    {"kk", "k"}, {"qq", "q"}, {"uu", "u"}, {"ww", "w"},
    {"xx", "x"}, {"yy", "y"}, {"zz", "z"}, {"eae", "ae"},
};

bool ends_with(const std::string& s, char c) {
    return !s.empty() && s.back() == c;
}

}  // namespace

std::string pronounceable_word() {
    std::string word;
    bool vowel_next = weighted_rand(1) == 1;
    int64_t steps = weighted_rand(5, 4);

    for (int64_t i = 0; i < steps; ++i) {
        size_t word_len = word.size();

        if (vowel_next) {
            if (weighted_rand(3) == 0 && word_len > 1) {
                word += pick_one(VOWEL_SUFFIXES);
                break;
            }
            word += pick_one(charsets::VOWELS2, 2);
        } else {
            if (weighted_rand(3) == 0 && word_len > 0) {
                word += pick_one(CONSONANT_SUFFIXES);
                break;
            }

            // Doubled clusters such as "nd" never open a word
            if (weighted_rand(3) == 0 && word_len > 0) {
                word += pick_one(charsets::CONSONANTS3);
            } else {
                word += pick_one(charsets::CONSONANTS2, 2);
            }

            if (ends_with(word, 't') && weighted_rand(2) == 0 && word_len > 1) {
                word += pick_one(T_SUFFIXES);
                break;
            }
        }

        vowel_next = !vowel_next;
    }

    for (const auto& [from, to] : PRONOUNCEABLE_CLEANUP) {
        word = replace_all(word, from, to);
    }

    // i before e except after c
    word = replace_all(word, "cie", "cei");

    if (word.size() >= 2 && word[0] == word[1]) {
        word.erase(0, 1);
    }

    return word;
}

std::string fake_word(std::string_view base) {
    std::string prefix = pick_one(FAKE_PREFIXES);
    std::string suffix = pick_one(FAKE_SUFFIXES);

    if (weighted_rand(100) <= 20 && prefix.find('-') == std::string::npos) {
        prefix += "-";
    }

    std::string word;
    switch (weighted_rand(5, 1)) {
        case 1:
            word = prefix + std::string(base) + suffix;
            break;
        case 2:
            word = std::string(base) + suffix;
            break;
        default:
            word = prefix + std::string(base);
            break;
    }

    for (const auto& [from, to] : FAKE_WORD_CLEANUP) {
        word = replace_all(word, from, to);
    }

    return word;
}

}  // namespace mnemo
