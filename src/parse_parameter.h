#ifndef MAXWEIGHTMATCHING_PARSE_PARAMETER_H
#define MAXWEIGHTMATCHING_PARSE_PARAMETER_H
#include <string>
#include <optional>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>
#include "lp_solver/ORToolsBackend.h"
#include "matching/MaxWeightMatching.h"

struct Config {
    BackendType backend;
    std::string filename;
    double tolerance = 1e-5;
    bool debug = false;

    MatchingConfig matchingConfig() const {
        MatchingConfig cfg;
        cfg.extractor.tolerance = tolerance;
        cfg.debug = debug;
        return cfg;
    }
};


inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return std::tolower(c); });
    return s;
}

inline std::optional<BackendType> parse_backend_token(std::string s) {
    s = to_lower(std::move(s));
    if (s == "auto" || s == "a")
        return BackendType::AUTO;
    // LP only, bipartite graphs
    if (s == "glop" || s == "lp" || s == "g")
        return BackendType::GLOP;
    if (s == "scip" || s == "mip" || s == "s")
        return BackendType::SCIP;
    if (s == "cbc" || s == "c")
        return BackendType::CBC;

    if (s == "0") return BackendType::AUTO;
    if (s == "1") return BackendType::GLOP;
    if (s == "2") return BackendType::SCIP;
    if (s == "3") return BackendType::CBC;

    return std::nullopt;
}

inline std::optional<double> parse_tolerance_token(const std::string& s) {
    try {
        size_t pos = 0;
        double tol = std::stod(s, &pos);
        if (pos != s.size() || !(tol > 0.0 && tol < 0.5)) {
            return std::nullopt;
        }
        return tol;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

inline std::string usage(const char* prog) {
    std::ostringstream os;
    os << "Usage:\n"
       << "  " << prog << " <backend> <graph_file> [tolerance] [--debug]\n\n"
       << "Backends (case-insensitive):\n"
       << "  auto | a         -> GLOP if the graph is bipartite, SCIP (or CBC) otherwise\n"
       << "  glop | lp | g    -> LP relaxation, bipartite graphs only\n"
       << "  scip | mip | s   -> Integer program (SCIP)\n"
       << "  cbc | c          -> Integer program (CBC)\n"
       << "Numeric shortcuts: 0=auto, 1=glop, 2=scip, 3=cbc\n"
       << "[Optional] tolerance in (0, 0.5) for reading edge variables, default 1e-5\n"
       << "[Optional] --debug prints the edge variables of the solution\n"
       << "The graph file is in LGF format, with an optional weight column in the @edges section.\n";

    return os.str();
}


// Returns Config on success; prints an error to `err` string on failure.
inline std::optional<Config> parse_parameter(int argc, char** argv, std::string* err) {
    if (argc < 3 || argc > 5) {
        if (err) *err = usage(argv[0]);
        return std::nullopt;
    }

    auto backend_opt = parse_backend_token(argv[1]);
    if (!backend_opt) {
        if (err) *err = "Unknown backend: " + std::string(argv[1]) + "\n" + usage(argv[0]);
        return std::nullopt;
    }

    Config cfg;
    cfg.backend = *backend_opt;
    cfg.filename = std::string(argv[2]);

    bool tolerance_seen = false;
    for (int i = 3; i < argc; i++) {
        std::string arg(argv[i]);
        if (arg == "--debug" || arg == "-d") {
            if (cfg.debug) {
                if (err) *err = "Duplicate flag: " + arg + "\n" + usage(argv[0]);
                return std::nullopt;
            }
            cfg.debug = true;
            continue;
        }

        auto tol_opt = parse_tolerance_token(arg);
        if (!tol_opt || tolerance_seen) {
            if (err) *err = "Invalid tolerance: " + arg + "\n" + usage(argv[0]);
            return std::nullopt;
        }
        cfg.tolerance = *tol_opt;
        tolerance_seen = true;
    }

    return cfg;
}

#endif //MAXWEIGHTMATCHING_PARSE_PARAMETER_H
