#include "WordList.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <vector>
#include <sys/stat.h>

static std::string toLower(std::string s) {
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

static bool isAsciiAlpha(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool WordList::isValidWord(const std::string& line) {
    return !line.empty() && std::all_of(line.begin(), line.end(), isAsciiAlpha);
}

bool WordList::isKnownWord(const TrainingSet& words, const std::string& candidate) {
    return words.count(candidate) != 0;
}

TrainingSet WordList::loadFromStream(std::istream& in, Reporter& reporter) {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    if (in.bad()) {
        throw NotFoundError("Word list could not be read to the end");
    }
    reporter.message("Total lines in word list: " + std::to_string(lines.size()));

    TrainingSet out;
    out.reserve(lines.size());
    for (size_t i = 0; i < lines.size(); ++i) {
        if (isValidWord(lines[i])) out.insert(toLower(lines[i]));
        if ((i + 1) % 10000 == 0) reporter.progress("cleaning", i + 1, lines.size());
    }
    reporter.progress("cleaning", lines.size(), lines.size());
    reporter.message("Removed " + std::to_string(lines.size() - out.size()) + " invalid or duplicate words");
    return out;
}

TrainingSet WordList::loadFromFile(const std::string& path, Reporter& reporter) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        throw NotFoundError("Word list file not found: \"" + path + "\"");
    }
    std::ifstream in(path);
    if (!in) {
        throw NotFoundError("Word list file is not readable: \"" + path + "\"");
    }
    reporter.message("Loading word list from: \"" + path + "\"");
    return loadFromStream(in, reporter);
}
