#include "ocr_layout/recognition_engine.h"

namespace ocr_layout {

namespace {

const std::string kPreserveSpaces = "--oem 3 --psm 6 -c preserve_interword_spaces=1";

} // namespace

const std::map<std::string, std::string>& RecognitionProfiles::all() {
    static const std::map<std::string, std::string> profiles = {
        {"default", "--oem 3 --psm 6"},
        {"paragraphs", kPreserveSpaces},
        {"long_paragraphs", kPreserveSpaces},
        {"document", kPreserveSpaces},
        {"single_line", "--oem 3 --psm 7"},
        {"single_word", "--oem 3 --psm 8"},
        {"single_char", "--oem 3 --psm 10"},
        {"sparse_text", "--oem 3 --psm 11"},
        {"sparse_text_osd", "--oem 3 --psm 12"},
        {"raw_line", "--oem 3 --psm 13"},
        {"uniform_block", "--oem 3 --psm 6 -c tessedit_char_whitelist="
                          "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz"},
        {"numbers_only", "--oem 3 --psm 6 -c tessedit_char_whitelist=0123456789"},
        {"letters_only", "--oem 3 --psm 6 -c tessedit_char_whitelist="
                         "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz"},
        {"long_text", kPreserveSpaces},
        {"academic", kPreserveSpaces},
        {"newspaper", kPreserveSpaces},
        {"handwritten", kPreserveSpaces},
    };
    return profiles;
}

std::string RecognitionProfiles::flags_for(const std::string& profile) {
    const auto& profiles = all();
    auto it = profiles.find(profile);
    if (it == profiles.end()) {
        return profiles.at("default");
    }
    return it->second;
}

bool RecognitionProfiles::contains(const std::string& profile) {
    return all().count(profile) > 0;
}

const std::map<std::string, std::string>& Languages::all() {
    static const std::map<std::string, std::string> languages = {
        {"afr", "Afrikaans"}, {"amh", "Amharic"}, {"ara", "Arabic"},
        {"asm", "Assamese"}, {"aze", "Azerbaijani"},
        {"aze_cyrl", "Azerbaijani (Cyrillic)"}, {"bel", "Belarusian"},
        {"ben", "Bengali"}, {"bod", "Tibetan"}, {"bos", "Bosnian"},
        {"bre", "Breton"}, {"bul", "Bulgarian"}, {"cat", "Catalan"},
        {"ceb", "Cebuano"}, {"ces", "Czech"},
        {"chi_sim", "Chinese (Simplified)"},
        {"chi_sim_vert", "Chinese (Simplified, Vertical)"},
        {"chi_tra", "Chinese (Traditional)"},
        {"chi_tra_vert", "Chinese (Traditional, Vertical)"},
        {"chr", "Cherokee"}, {"cos", "Corsican"}, {"cym", "Welsh"},
        {"dan", "Danish"}, {"deu", "German"}, {"div", "Dhivehi"},
        {"dzo", "Dzongkha"}, {"ell", "Greek"}, {"enm", "English (Middle)"},
        {"eng", "English"}, {"epo", "Esperanto"}, {"equ", "Math/Equation"},
        {"est", "Estonian"}, {"eus", "Basque"}, {"fao", "Faroese"},
        {"fas", "Persian"}, {"fil", "Filipino"}, {"fin", "Finnish"},
        {"fra", "French"}, {"frk", "German (Frankish)"},
        {"frm", "French (Middle)"}, {"fry", "Frisian"},
        {"gla", "Scottish Gaelic"}, {"gle", "Irish"}, {"glg", "Galician"},
        {"grc", "Greek (Ancient)"}, {"guj", "Gujarati"},
        {"hat", "Haitian Creole"}, {"heb", "Hebrew"}, {"hin", "Hindi"},
        {"hrv", "Croatian"}, {"hun", "Hungarian"}, {"hye", "Armenian"},
        {"iku", "Inuktitut"}, {"ind", "Indonesian"}, {"isl", "Icelandic"},
        {"ita", "Italian"}, {"ita_old", "Italian (Old)"}, {"jav", "Javanese"},
        {"jpn", "Japanese"}, {"jpn_vert", "Japanese (Vertical)"},
        {"kan", "Kannada"}, {"kat", "Georgian"}, {"kat_old", "Georgian (Old)"},
        {"kaz", "Kazakh"}, {"khm", "Khmer"}, {"kir", "Kyrgyz"},
        {"kmr", "Kurdish (Kurmanji)"}, {"kor", "Korean"},
        {"kor_vert", "Korean (Vertical)"}, {"lao", "Lao"}, {"lat", "Latin"},
        {"lav", "Latvian"}, {"lit", "Lithuanian"}, {"ltz", "Luxembourgish"},
        {"mal", "Malayalam"}, {"mar", "Marathi"}, {"mkd", "Macedonian"},
        {"mlt", "Maltese"}, {"mon", "Mongolian"}, {"mri", "Maori"},
        {"msa", "Malay"}, {"mya", "Burmese"}, {"nep", "Nepali"},
        {"nld", "Dutch"}, {"nor", "Norwegian"}, {"oci", "Occitan"},
        {"osd", "Orientation and Script Detection"}, {"pan", "Punjabi"},
        {"pol", "Polish"}, {"por", "Portuguese"}, {"pus", "Pashto"},
        {"que", "Quechua"}, {"ron", "Romanian"}, {"rus", "Russian"},
        {"san", "Sanskrit"}, {"sin", "Sinhala"}, {"slk", "Slovak"},
        {"slv", "Slovenian"}, {"snd", "Sindhi"}, {"spa", "Spanish"},
        {"spa_old", "Spanish (Old)"}, {"sqi", "Albanian"}, {"srp", "Serbian"},
        {"srp_latn", "Serbian (Latin)"}, {"sun", "Sundanese"},
        {"swa", "Swahili"}, {"swe", "Swedish"}, {"syr", "Syriac"},
        {"tam", "Tamil"}, {"tat", "Tatar"}, {"tel", "Telugu"},
        {"tgk", "Tajik"}, {"tha", "Thai"}, {"tir", "Tigrinya"},
        {"ton", "Tongan"}, {"tur", "Turkish"}, {"uig", "Uyghur"},
        {"ukr", "Ukrainian"}, {"urd", "Urdu"}, {"uzb", "Uzbek"},
        {"uzb_cyrl", "Uzbek (Cyrillic)"}, {"vie", "Vietnamese"},
        {"yid", "Yiddish"}, {"yor", "Yoruba"},
    };
    return languages;
}

bool Languages::is_supported(const std::string& code) {
    return all().count(code) > 0;
}

std::string Languages::name_of(const std::string& code) {
    const auto& languages = all();
    auto it = languages.find(code);
    return it == languages.end() ? code : it->second;
}

} // namespace ocr_layout
