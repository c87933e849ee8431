#include <Sofa2Hrir/SofaReader.h>
#include <Sofa2Hrir/ConsoleLogger.h>
#include <algorithm>
#include <netcdf>
#include <string>
#include <vector>

namespace sofa2hrir {

namespace {

std::vector<size_t> getShape(const netCDF::NcVar& var) {
    std::vector<size_t> shape;
    for (const auto& dim : var.getDims())
        shape.push_back(dim.getSize());
    return shape;
}

juce::String describeShape(const std::vector<size_t>& shape) {
    juce::StringArray parts;
    for (auto size : shape)
        parts.add(juce::String(size));
    return "[" + parts.joinIntoString(" x ") + "]";
}

size_t getTotalSize(const std::vector<size_t>& shape) {
    size_t total = 1;
    for (auto size : shape)
        total *= size;
    return total;
}

juce::Result findVar(const netCDF::NcFile& file, const char* name, netCDF::NcVar& var) {
    var = file.getVar(name);
    if (var.isNull())
        return juce::Result::fail("missing variable " + juce::String(name));
    return juce::Result::ok();
}

}  // namespace

juce::Result SofaReader::read(const juce::File& file, HrirDataset& dataset) {
    if (!file.existsAsFile())
        return juce::Result::fail("input file not found: " + file.getFullPathName());

    try {
        netCDF::NcFile sofa(file.getFullPathName().toStdString(), netCDF::NcFile::read);

        netCDF::NcVar positionVar, irVar, rateVar;
        for (auto result : {findVar(sofa, SofaVar::kSourcePosition, positionVar),
                            findVar(sofa, SofaVar::kDataIR, irVar),
                            findVar(sofa, SofaVar::kSamplingRate, rateVar)}) {
            if (result.failed())
                return result;
        }

        const auto positionShape = getShape(positionVar);
        if (positionShape.size() != 2 || positionShape[1] < 2)
            return juce::Result::fail(juce::String(SofaVar::kSourcePosition)
                                      + " has shape " + describeShape(positionShape)
                                      + ", expected [M x C] with C >= 2");

        const auto irShape = getShape(irVar);
        if (irShape.size() != 3 || irShape[1] != static_cast<size_t>(kNumEarSides))
            return juce::Result::fail(juce::String(SofaVar::kDataIR) + " has shape "
                                      + describeShape(irShape) + ", expected [M x 2 x N]");

        const size_t numMeasurements = positionShape[0];
        const size_t numCoords = positionShape[1];
        const size_t numSamples = irShape[2];

        if (irShape[0] != numMeasurements)
            return juce::Result::fail(juce::String(SofaVar::kDataIR) + " has "
                                      + juce::String(irShape[0]) + " measurements but "
                                      + juce::String(SofaVar::kSourcePosition) + " has "
                                      + juce::String(numMeasurements));

        // SamplingRate is [I] or [M]; the first entry is taken in both cases
        std::vector<double> rates(std::max<size_t>(getTotalSize(getShape(rateVar)), 1));
        rateVar.getVar(rates.data());

        std::vector<double> positions(numMeasurements * numCoords);
        positionVar.getVar(positions.data());

        std::vector<double> ir(numMeasurements * kNumEarSides * numSamples);
        irVar.getVar(ir.data());

        dataset.samplingRate = rates.front();
        dataset.positions.assign(numMeasurements, {});
        dataset.responses.assign(numMeasurements, {});

        for (size_t m = 0; m < numMeasurements; ++m) {
            const double* row = positions.data() + m * numCoords;
            auto& position = dataset.positions[m];
            position.azimuth = row[0];
            position.elevation = row[1];
            if (numCoords > 2)
                position.distance = row[2];

            for (int side = 0; side < kNumEarSides; ++side) {
                const double* taps = ir.data() + (m * kNumEarSides + static_cast<size_t>(side)) * numSamples;
                dataset.responses[m].ears[static_cast<size_t>(side)].assign(taps, taps + numSamples);
            }
        }

        logDebug("read " + juce::String(numMeasurements) + " measurements of "
                 + juce::String(numSamples) + " samples at " + juce::String(dataset.samplingRate)
                 + " Hz from " + file.getFileName());
    } catch (const netCDF::exceptions::NcException& e) {
        return juce::Result::fail("cannot read " + file.getFullPathName() + ": " + e.what());
    }

    return dataset.validate();
}

}  // namespace sofa2hrir
