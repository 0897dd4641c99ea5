/*
 * Copyright (c) 2022, Shiv Nadar University, Delhi NCR, India. All Rights
 * Reserved. Permission to use, copy, modify and distribute this software for
 * educational, research, and not-for-profit purposes, without fee and without a
 * signed license agreement, is hereby granted, provided that this paragraph and
 * the following two paragraphs appear in all copies, modifications, and
 * distributions.
 *
 * IN NO EVENT SHALL SHIV NADAR UNIVERSITY BE LIABLE TO ANY PARTY FOR DIRECT,
 * INDIRECT, SPECIAL, INCIDENTAL, OR CONSEQUENTIAL DAMAGES, INCLUDING LOST
 * PROFITS, ARISING OUT OF THE USE OF THIS SOFTWARE.
 *
 * SHIV NADAR UNIVERSITY SPECIFICALLY DISCLAIMS ANY WARRANTIES, INCLUDING, BUT
 * NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE. THE SOFTWARE PROVIDED HEREUNDER IS PROVIDED "AS IS". SHIV
 * NADAR UNIVERSITY HAS NO OBLIGATION TO PROVIDE MAINTENANCE, SUPPORT, UPDATES,
 * ENHANCEMENTS, OR MODIFICATIONS.
 */
/**
 * @file ModelCardParser.cpp
 * @brief Implementation of the ModelCardParser declared in ModelCardParser.hpp.
 *
 * The parser works in two passes:
 *
 *  1. Read the card file, drop comments, uppercase the text and fold `+`
 *     continuation lines into logical lines (remembering the line number
 *     where each logical line starts).
 *  2. Tokenize each logical line and dispatch on the leading directive
 *     (`.MODEL`, `.SWEEP`, `.END`).
 *
 * Keep API-level documentation in the header.
 */

#include "ModelCardParser.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <unordered_map>
#include <utility>

int ModelCardParser::parse(const std::string &fileName,
                           ModelParameters &params, SweepOptions &sweep)
{
    std::ifstream fileStream(fileName);
    if (!fileStream) {
        std::cerr << "Error: Model card '" << fileName << "' not available"
                  << std::endl;
        return 1;
    }
    return parseStream(fileStream, params, sweep);
}

int ModelCardParser::parseStream(std::istream &in, ModelParameters &params,
                                 SweepOptions &sweep)
{
    std::string line;
    int lineNumber = 0;
    int errorCount = 0;
    modelName.clear();

    // First pass: logical lines (continuations folded), with start line
    std::vector<std::pair<int, std::string>> logicalLines;
    while (std::getline(in, line)) {
        ++lineNumber;

        // Strip trailing comment
        size_t cut = line.find_first_of("*;");
        if (cut != std::string::npos) line.erase(cut);

        size_t firstChar = line.find_first_not_of(" \t\r\n");
        if (firstChar == std::string::npos) continue;

        std::string up = line.substr(firstChar);
        std::transform(up.begin(), up.end(), up.begin(), ::toupper);

        if (up[0] == '+') {
            if (logicalLines.empty()) {
                std::cerr << "Line " << lineNumber
                          << ": Continuation line without a preceding card"
                          << std::endl;
                ++errorCount;
                continue;
            }
            logicalLines.back().second += " " + up.substr(1);
            continue;
        }
        logicalLines.emplace_back(lineNumber, up);
    }

    // Second pass: tokenize and dispatch
    for (const auto &entry : logicalLines) {
        std::string text = entry.second;
        for (auto &c : text) {
            if (c == '(' || c == ')' || c == ',') c = ' ';
        }
        // Make '=' its own token so "TFE=20N" and "TFE = 20N" tokenize alike
        std::string spaced;
        for (char c : text) {
            if (c == '=')
                spaced += " = ";
            else
                spaced += c;
        }

        std::istringstream iss(spaced);
        std::vector<std::string> tokens;
        std::string tok;
        while (iss >> tok) tokens.push_back(tok);
        if (tokens.empty()) continue;

        if (tokens[0] == ".END") break;

        if (tokens[0] == ".MODEL") {
            if (!modelName.empty()) {
                std::cerr << "Line " << entry.first
                          << ": Multiple .MODEL cards found. Using the first "
                             "one."
                          << std::endl;
                ++errorCount;
                continue;
            }
            errorCount += parseModelLine(tokens, params, entry.first);
        } else if (tokens[0] == ".SWEEP") {
            errorCount += parseSweepLine(tokens, sweep, entry.first);
        } else {
            std::cerr << "Line " << entry.first << ": Unknown card '"
                      << tokens[0] << "'" << std::endl;
            ++errorCount;
        }
    }

    if (modelName.empty()) {
        std::cerr << "Error: No .MODEL card found" << std::endl;
        ++errorCount;
    }
    return errorCount;
}

int ModelCardParser::parseModelLine(const std::vector<std::string> &tokens,
                                    ModelParameters &params, int lineNumber)
{
    // .MODEL <name> FECAP KEY = VALUE ...
    if (tokens.size() < 3) {
        std::cerr << "Line " << lineNumber
                  << ": .MODEL requires a name and a type" << std::endl;
        return 1;
    }
    if (tokens[2] != "FECAP") {
        std::cerr << "Line " << lineNumber << ": Unsupported model type '"
                  << tokens[2] << "' (expected FECAP)" << std::endl;
        return 1;
    }
    modelName = tokens[1];

    int errors = 0;
    size_t i = 3;
    while (i < tokens.size()) {
        if (i + 2 >= tokens.size()) {
            std::cerr << "Line " << lineNumber
                      << ": Incomplete parameter assignment near '"
                      << tokens[i] << "'" << std::endl;
            ++errors;
            break;
        }
        const std::string &key = tokens[i];
        if (tokens[i + 1] != "=") {
            std::cerr << "Line " << lineNumber << ": Expected '=' after '"
                      << key << "'" << std::endl;
            ++errors;
            ++i;
            continue;
        }
        bool valid = false;
        double value = parseValue(tokens[i + 2], lineNumber, valid);
        if (!valid)
            ++errors;
        else if (!assignParameter(key, value, params, lineNumber))
            ++errors;
        i += 3;
    }
    return errors;
}

int ModelCardParser::parseSweepLine(const std::vector<std::string> &tokens,
                                    SweepOptions &sweep, int lineNumber)
{
    // .SWEEP <amplitude> <steps> <period>
    if (!validateTokens(tokens, 4, lineNumber)) return 1;

    bool okAmp = false, okSteps = false, okPeriod = false;
    double amplitude = parseValue(tokens[1], lineNumber, okAmp);
    double steps = parseValue(tokens[2], lineNumber, okSteps);
    double period = parseValue(tokens[3], lineNumber, okPeriod);
    if (!okAmp || !okSteps || !okPeriod) return 1;

    if (std::floor(steps) != steps) {
        std::cerr << "Line " << lineNumber
                  << ": .SWEEP step count must be an integer" << std::endl;
        return 1;
    }
    if (steps < static_cast<double>(std::numeric_limits<int>::min()) ||
        steps > static_cast<double>(std::numeric_limits<int>::max())) {
        std::cerr << "Line " << lineNumber
                  << ": .SWEEP step count out of range: " << steps
                  << std::endl;
        return 1;
    }
    sweep.amplitude = amplitude;
    sweep.stepsPerSegment = static_cast<int>(steps);
    sweep.period = period;
    return 0;
}

bool ModelCardParser::assignParameter(const std::string &key, double value,
                                      ModelParameters &params, int lineNumber)
{
    auto requireIntegral = [&](const char *name) {
        if (std::floor(value) != value) {
            std::cerr << "Line " << lineNumber << ": " << name
                      << " must be an integer, got " << value << std::endl;
            return false;
        }
        return true;
    };
    // [min, -min) of a signed type and [0, 2 * (max / 2 + 1)) of an unsigned
    // one are exact in double, unlike max itself
    auto requireRange = [&](const char *name, double lo, double hi) {
        if (value < lo || value >= hi) {
            std::cerr << "Line " << lineNumber << ": " << name
                      << " out of range: " << value << std::endl;
            return false;
        }
        return true;
    };

    if (key == "TFE")
        params.thickness = value;
    else if (key == "EC")
        params.coerciveField = value;
    else if (key == "EPS")
        params.relativePermittivity = value;
    else if (key == "PS")
        params.saturationPolarization = value;
    else if (key == "SLOPE")
        params.slopeFactor = value;
    else if (key == "QERR")
        params.chargeErrorFraction = value;
    else if (key == "VTOL")
        params.voltageTolerance = value;
    else if (key == "DELAY")
        params.delayCoefficient = value;
    else if (key == "MAXITER") {
        if (!requireIntegral("MAXITER") ||
            !requireRange(
                "MAXITER",
                static_cast<double>(std::numeric_limits<int>::min()),
                -static_cast<double>(std::numeric_limits<int>::min())))
            return false;
        params.maxIterations = static_cast<int>(value);
    } else if (key == "SEED") {
        if (!requireIntegral("SEED") ||
            !requireRange(
                "SEED",
                static_cast<double>(std::numeric_limits<std::int64_t>::min()),
                -static_cast<double>(
                    std::numeric_limits<std::int64_t>::min())))
            return false;
        params.seed = static_cast<std::int64_t>(value);
    } else if (key == "NHIST") {
        if (!requireIntegral("NHIST") ||
            !requireRange(
                "NHIST", 0.0,
                2.0 * static_cast<double>(
                          std::numeric_limits<std::size_t>::max() / 2 + 1)))
            return false;
        params.historyCapacity = static_cast<std::size_t>(value);
    } else {
        std::cerr << "Line " << lineNumber << ": Unknown parameter '" << key
                  << "'" << std::endl;
        return false;
    }
    return true;
}

bool ModelCardParser::validateTokens(const std::vector<std::string> &tokens,
                                     int expectedSize, int lineNumber)
{
    if (static_cast<int>(tokens.size()) != expectedSize) {
        std::cerr << "Line " << lineNumber << ": Expected " << expectedSize
                  << " tokens, got " << tokens.size() << std::endl;
        return false;
    }
    return true;
}

double ModelCardParser::parseValue(const std::string &valueStr,
                                   int lineNumber, bool &valid)
{
    // Strict SPICE-style parsing: recognized suffix (T, G, MEG, K, M, U, N,
    // P, F) after a mantissa that std::stod must consume completely.
    if (valueStr.empty()) {
        std::cerr << "Line " << lineNumber << ": Invalid value '" << valueStr
                  << "'" << std::endl;
        valid = false;
        return 0.0;
    }

    static const std::unordered_map<std::string, double> suffixMap = {
        {"T", 1e12}, {"G", 1e9},  {"MEG", 1e6}, {"K", 1e3},  {"M", 1e-3},
        {"U", 1e-6}, {"N", 1e-9}, {"P", 1e-12}, {"F", 1e-15}};

    size_t pos = valueStr.size();
    while (pos > 0 && std::isalpha((unsigned char)valueStr[pos - 1])) --pos;

    std::string mantissa = valueStr.substr(0, pos);
    std::string suffix = valueStr.substr(pos);

    if (mantissa.empty()) {
        std::cerr << "Line " << lineNumber << ": Invalid value '" << valueStr
                  << "'" << std::endl;
        valid = false;
        return 0.0;
    }

    for (auto &c : suffix) c = (char)std::toupper((unsigned char)c);

    auto parseMantissaStrict = [](const std::string &m, double &out) {
        try {
            size_t idx = 0;
            out = std::stod(m, &idx);
            return idx == m.size();
        } catch (const std::exception &) {
            return false;
        }
    };

    double base = 0.0;
    if (!parseMantissaStrict(mantissa, base)) {
        std::cerr << "Line " << lineNumber << ": Invalid numeric part '"
                  << mantissa << "' in '" << valueStr << "'" << std::endl;
        valid = false;
        return 0.0;
    }

    if (suffix.empty()) {
        valid = true;
        return base;
    }

    auto it = suffixMap.find(suffix);
    if (it == suffixMap.end()) {
        std::cerr << "Line " << lineNumber << ": Unknown suffix '" << suffix
                  << "' in value '" << valueStr << "'" << std::endl;
        valid = false;
        return 0.0;
    }

    valid = true;
    return base * it->second;
}
