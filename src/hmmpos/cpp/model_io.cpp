#include "model_io.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>

namespace hmmpos {

namespace {

const char* const MODEL_HEADER = "HMMPOS_Model_v1";

void check_token(const std::string& token) {
    if (token.empty() || std::any_of(token.begin(), token.end(),
                                     [](unsigned char c) { return std::isspace(c); })) {
        throw ModelFormatError("cannot store token '" + token + "'");
    }
}

// Sorted copies so the same model always produces the same file
void write_table(std::ostream& out, const char* name, const CountTable& table) {
    std::map<std::string, int> sorted(table.begin(), table.end());
    out << name << " " << sorted.size() << "\n";
    for (const auto& entry : sorted) {
        check_token(entry.first);
        out << entry.first << " " << entry.second << "\n";
    }
}

void write_table(std::ostream& out, const char* name, const PairCountTable& table) {
    std::map<std::string, std::map<std::string, int>> sorted;
    size_t size = 0;
    for (const auto& outer : table) {
        sorted[outer.first].insert(outer.second.begin(), outer.second.end());
        size += outer.second.size();
    }
    out << name << " " << size << "\n";
    for (const auto& outer : sorted) {
        check_token(outer.first);
        for (const auto& inner : outer.second) {
            check_token(inner.first);
            out << outer.first << " " << inner.first << " " << inner.second << "\n";
        }
    }
}

size_t read_section(std::istream& in, const std::string& name) {
    std::string label;
    size_t size = 0;
    if (!(in >> label >> size) || label != name) {
        throw ModelFormatError("expected section '" + name + "'");
    }
    return size;
}

void read_table(std::istream& in, const std::string& name, CountTable& table) {
    size_t size = read_section(in, name);
    for (size_t i = 0; i < size; ++i) {
        std::string key;
        int count;
        if (!(in >> key >> count) || count < 0) {
            throw ModelFormatError("bad entry " + std::to_string(i) + " in section '" + name + "'");
        }
        table[key] = count;
    }
}

void read_table(std::istream& in, const std::string& name, PairCountTable& table) {
    size_t size = read_section(in, name);
    for (size_t i = 0; i < size; ++i) {
        std::string first;
        std::string second;
        int count;
        if (!(in >> first >> second >> count) || count < 0) {
            throw ModelFormatError("bad entry " + std::to_string(i) + " in section '" + name + "'");
        }
        table[first][second] = count;
    }
}

} // namespace

void write_model(const HmmModel& model, std::ostream& out) {
    const FrequencyTables& tables = model.tables();

    out << MODEL_HEADER << "\n";
    out << "sentences " << tables.num_sentences << "\n";
    write_table(out, "unigram", tables.unigram);
    write_table(out, "bigram", tables.bigram);
    write_table(out, "emission", tables.emission);
    write_table(out, "start", tables.start);
    write_table(out, "end", tables.end);

    if (!out) {
        throw ModelFormatError("write failed");
    }
}

void save_model(const HmmModel& model, const std::string& filename) {
    std::ofstream file(filename);
    if (!file) {
        throw ModelFormatError("cannot open file for writing: " + filename);
    }
    write_model(model, file);
}

std::shared_ptr<const HmmModel> read_model(std::istream& in, const TaggerConfig& config) {
    std::string header;
    std::getline(in, header);
    if (header != MODEL_HEADER) {
        throw ModelFormatError("invalid header '" + header + "'");
    }

    FrequencyTables tables;
    tables.num_sentences = read_section(in, "sentences");
    read_table(in, "unigram", tables.unigram);
    read_table(in, "bigram", tables.bigram);
    read_table(in, "emission", tables.emission);
    read_table(in, "start", tables.start);
    read_table(in, "end", tables.end);

    // The vocabulary is every word with a non-zero emission count
    for (const auto& tag_entry : tables.emission) {
        for (const auto& word_count : tag_entry.second) {
            if (word_count.second > 0) {
                tables.vocabulary.insert(word_count.first);
            }
        }
    }

    return build_model(tables, config);
}

std::shared_ptr<const HmmModel> load_model(const std::string& filename, const TaggerConfig& config) {
    std::ifstream file(filename);
    if (!file) {
        throw ModelFormatError("cannot open file for reading: " + filename);
    }
    return read_model(file, config);
}

} // namespace hmmpos
