#ifndef MAXWEIGHTMATCHING_LGF_READER_H
#define MAXWEIGHTMATCHING_LGF_READER_H

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>
#include "IGraph.h"
#include "../matching/WeightMatrix.h"


inline std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

inline std::vector<std::string> splitTokens(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string tok;
    while (iss >> tok) {
        tokens.push_back(tok);
    }
    return tokens;
}


/*
 * Reads an undirected graph in LGF format into g and returns its weight matrix.
 *
 *   @nodes
 *   label
 *   0
 *   1
 *   @edges
 *           label  weight
 *   0   1   0      3.5
 *
 * The edge header names the columns after the two endpoints. The weight is taken
 * from the "weight" column, or "cost" if there is none; missing weights default to 1.
 * Malformed edge lines are skipped.
 */
inline WeightMatrix readLGFFile(IGraph& g, const std::string& filename) {
        std::ifstream infile(filename);
        if (!infile) {
            throw std::runtime_error("Could not open LGF file: " + filename);
        }

        std::string line;
        std::vector<std::string> allLines;
        while (std::getline(infile, line)) {
            // skip blank or comment lines
            if (line.empty() || line[0] == '#') {
                continue;
            }
            if (splitTokens(line).empty()) {
                continue;
            }
            allLines.push_back(line);
        }
        infile.close();

        bool inNodesSection = false;
        int maxNodeIdSeen = -1;

        // 1) First pass: scan for "@nodes" -> read node lines -> track maxNodeIdSeen.
        for (const std::string& raw : allLines) {
            std::string lower = lowercase(raw);

            if (!inNodesSection) {
                if (lower.rfind("@nodes", 0) == 0) {
                    inNodesSection = true;
                }
                continue;
            }
            if (lower.rfind("@", 0) == 0) {
                break;
            }

            // the first token of a node line is its label
            std::vector<std::string> tokens = splitTokens(raw);
            try {
                size_t pos = 0;
                int nid = std::stoi(tokens[0], &pos);
                if (pos == tokens[0].size()) {
                    maxNodeIdSeen = std::max(maxNodeIdSeen, nid);
                }
            } catch (const std::logic_error&) {
                // header line or malformed line: skip
            }
        }

        if (maxNodeIdSeen < 0) {
            throw std::runtime_error("LGF file had no valid @nodes section or no node IDs found: " + filename);
        }

        // 2) Initialize our graph with (maxNodeIdSeen+1) nodes
        g.InitializeMemberByParser(maxNodeIdSeen);

        // 3) Second pass: scan for "@edges"/"@arcs", find header, then parse each edge line
        std::vector<std::tuple<int, int, double>> weighted_edges;
        bool inEdgesSection = false;
        bool readHeader = false;
        int weightColIdx = -1;

        for (const std::string& raw : allLines) {
            std::string lower = lowercase(raw);

            if (!inEdgesSection) {
                if (lower.rfind("@edges", 0) == 0 || lower.rfind("@arcs", 0) == 0) {
                    inEdgesSection = true;
                }
                continue;
            }
            if (lower.rfind("@", 0) == 0) {
                break;
            }

            if (!readHeader) {
                std::vector<std::string> headerTokens = splitTokens(lower);
                int costColIdx = -1;
                for (int col = 0; col < static_cast<int>(headerTokens.size()); ++col) {
                    if (headerTokens[col] == "weight") weightColIdx = col;
                    if (headerTokens[col] == "cost") costColIdx = col;
                }
                if (weightColIdx < 0) weightColIdx = costColIdx;
                // data lines start with the two endpoints, which the header does not name
                if (weightColIdx >= 0) weightColIdx += 2;
                readHeader = true;
                continue;
            }

            std::vector<std::string> parts = splitTokens(raw);
            if (parts.size() < 2) {
                continue;
            }

            int u, v;
            try {
                size_t pos_u = 0, pos_v = 0;
                u = std::stoi(parts[0], &pos_u);
                v = std::stoi(parts[1], &pos_v);
                if (pos_u != parts[0].size() || pos_v != parts[1].size()) {
                    continue; // malformed, e.g. "1.5" or "2abc"
                }
            } catch (const std::logic_error&) {
                continue; // malformed
            }
            if (u < 0 || v < 0 || u >= g.n || v >= g.n || u == v) {
                continue;
            }

            double weight = 1.0;
            if (weightColIdx >= 0 && weightColIdx < static_cast<int>(parts.size())) {
                try {
                    weight = std::stod(parts[weightColIdx]);
                } catch (const std::logic_error&) {
                    weight = 1.0;
                }
            }

            weighted_edges.emplace_back(u, v, weight);
        }

        WeightMatrix w(g.getNumNodes());
        std::set<Edge> seen;
        for (const auto& [u, v, weight] : weighted_edges) {
            const Edge e = canonicalEdge(u, v);
            if (seen.insert(e).second) {
                g.addEdge(u, v);
                w.set(e.first, e.second, weight);
            } else if (weight > w.get(e.first, e.second)) {
                // a repeated edge keeps the larger weight
                w.set(e.first, e.second, weight);
            }
        }
        g.finalize();
        return w;
    }



#endif //MAXWEIGHTMATCHING_LGF_READER_H
