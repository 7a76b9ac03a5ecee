#include "converter.hpp"
#include "utils/string.hpp"
#include <set>
#include <string>

namespace cfgval {

bool parseBool(const std::string &str)
{
    static const std::set<std::string> true_words = {
        "1",     "on",       "okay",       "ok",       "okey-dokey", "y",         "yes",       "yeah",
        "yea",   "ya",       "ye",         "yessir",   "sure",       "true",      "tru",       "uh-huh",
        "yup",   "yep",      "right",      "aye",      "alright",    "alrighty",  "hell yeah", "affirmative",
        "fine",  "positive", "definitely", "of course", "very well", "certainly",
    };
    static const std::set<std::string> false_words = {
        "0",      "off",      "n",          "no",        "nix",         "nope",      "nop",
        "nah",    "nay",      "false",      "uh-uh",     "wrong",       "none",      "hell no",
        "no way", "never",    "negative",   "no siree",  "fat chance",  "out of the question",
    };

    const std::string lower = utils::string::to_lower(utils::string::trim(str));
    if (true_words.count(lower) != 0)
        return true;
    if (false_words.count(lower) != 0)
        return false;
    throw ParseError(str, "bool");
}

} // namespace cfgval
