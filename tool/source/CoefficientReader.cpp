#include <Sofa2Hrir/CoefficientReader.h>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace sofa2hrir {

namespace {

juce::String atLine(int zeroBasedLine) {
    return "line " + juce::String(zeroBasedLine + 1) + ": ";
}

}  // namespace

bool CoefficientReader::parseValue(const juce::String& token, double& value) {
    const juce::String trimmed = token.trim();
    if (trimmed.isEmpty())
        return false;

    const char* start = trimmed.toRawUTF8();
    char* end = nullptr;
    const double parsed = std::strtod(start, &end);

    if (end == start || *end != 0 || !std::isfinite(parsed))
        return false;

    value = parsed;
    return true;
}

juce::Result CoefficientReader::readGroups(const juce::String& text, double& samplingRate,
                                           std::vector<Group>& groups) {
    const auto lines = juce::StringArray::fromLines(text);
    const int numLines = lines.size();

    if (numLines < 2)
        return juce::Result::fail("missing sampling rate header");

    if (!parseValue(lines[0], samplingRate) || samplingRate <= 0.0)
        return juce::Result::fail(atLine(0) + "invalid sampling rate '" + lines[0] + "'");

    if (lines[1].isNotEmpty())
        return juce::Result::fail(atLine(1) + "expected a blank line after the sampling rate");

    groups.clear();
    int i = 2;

    while (i < numLines) {
        if (lines[i].isEmpty()) {
            // fromLines() yields one trailing empty entry for the final "\n"
            if (i == numLines - 1)
                break;
            return juce::Result::fail(atLine(i) + "unexpected blank line");
        }

        const int groupStart = i;
        Group group;

        for (;;) {
            if (i >= numLines)
                return juce::Result::fail(atLine(groupStart)
                                          + "group is not terminated by a blank line");

            if (lines[i].isEmpty()) {
                ++i;
                break;
            }

            juce::StringArray tokens;
            tokens.addTokens(lines[i], ",", {});

            std::vector<double> row;
            row.reserve(static_cast<size_t>(tokens.size()));
            for (const auto& token : tokens) {
                double value = 0.0;
                if (!parseValue(token, value))
                    return juce::Result::fail(atLine(i) + "invalid value '" + token.trim() + "'");
                row.push_back(value);
            }

            group.push_back(std::move(row));
            ++i;
        }

        groups.push_back(std::move(group));
    }

    return juce::Result::ok();
}

juce::Result CoefficientReader::readAmbisonic(const juce::String& text,
                                              AmbisonicCoefficientSet& output) {
    std::vector<Group> groups;
    auto result = readGroups(text, output.samplingRate, groups);
    if (result.failed())
        return result;

    if (groups.size() != static_cast<size_t>(kNumEarSides))
        return juce::Result::fail("expected " + juce::String(kNumEarSides) + " ear groups, found "
                                  + juce::String(groups.size()));

    if (groups[EarSide::Left].size() != groups[EarSide::Right].size())
        return juce::Result::fail("left and right groups differ in length");

    for (size_t side = 0; side < groups.size(); ++side) {
        auto& rows = output.ears[side];
        rows.clear();
        rows.reserve(groups[side].size());

        for (size_t t = 0; t < groups[side].size(); ++t) {
            const auto& row = groups[side][t];
            if (row.size() != static_cast<size_t>(kNumAmbiChannels))
                return juce::Result::fail("group " + juce::String(side + 1) + " row "
                                          + juce::String(t + 1) + " has "
                                          + juce::String(row.size()) + " values, expected "
                                          + juce::String(kNumAmbiChannels));

            ChannelWeights weights{};
            std::copy(row.begin(), row.end(), weights.begin());
            rows.push_back(weights);
        }
    }

    return juce::Result::ok();
}

juce::Result CoefficientReader::readVirtualFeeds(const juce::String& text, VirtualFeedSet& output) {
    std::vector<Group> groups;
    auto result = readGroups(text, output.samplingRate, groups);
    if (result.failed())
        return result;

    if (groups.empty())
        return juce::Result::fail("no feed groups");

    output.feeds.clear();
    output.feeds.reserve(groups.size());

    for (size_t f = 0; f < groups.size(); ++f) {
        const auto& group = groups[f];
        const juce::String label = "feed " + juce::String(f + 1);

        if (group.size() != 3)
            return juce::Result::fail(label + " has " + juce::String(group.size())
                                      + " rows, expected 3");

        if (group[0].size() != static_cast<size_t>(kNumAmbiChannels))
            return juce::Result::fail(label + " weight row has " + juce::String(group[0].size())
                                      + " values, expected " + juce::String(kNumAmbiChannels));

        if (group[1].size() != group[2].size())
            return juce::Result::fail(label + " left and right responses differ in length");

        if (f > 0 && group[1].size() != output.feeds.front().response.left().size())
            return juce::Result::fail(label + " response length differs from feed 1");

        VirtualFeedOutput feed;
        feed.name = label;
        std::copy(group[0].begin(), group[0].end(), feed.decodeWeights.begin());
        feed.response.ears[EarSide::Left] = group[1];
        feed.response.ears[EarSide::Right] = group[2];
        output.feeds.push_back(std::move(feed));
    }

    return juce::Result::ok();
}

}  // namespace sofa2hrir
