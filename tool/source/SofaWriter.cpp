#include <Sofa2Hrir/SofaWriter.h>
#include <netcdf>
#include <string>
#include <vector>

namespace sofa2hrir {

juce::Result SofaWriter::write(const juce::File& file, const HrirDataset& dataset) {
    auto valid = dataset.validate();
    if (valid.failed())
        return valid;

    const size_t numMeasurements = dataset.getNumMeasurements();
    const size_t numSamples = dataset.getNumSamples();
    constexpr size_t numCoords = 3;

    std::vector<double> positions;
    positions.reserve(numMeasurements * numCoords);
    for (const auto& p : dataset.positions) {
        positions.push_back(p.azimuth);
        positions.push_back(p.elevation);
        positions.push_back(p.distance);
    }

    std::vector<double> ir;
    ir.reserve(numMeasurements * kNumEarSides * numSamples);
    for (const auto& response : dataset.responses)
        for (const auto& ear : response.ears)
            ir.insert(ir.end(), ear.begin(), ear.end());

    try {
        netCDF::NcFile sofa(file.getFullPathName().toStdString(), netCDF::NcFile::replace,
                            netCDF::NcFile::nc4);

        sofa.putAtt("Conventions", "SOFA");
        sofa.putAtt("SOFAConventions", "SimpleFreeFieldHRIR");
        sofa.putAtt("DataType", "FIR");

        const auto dimI = sofa.addDim("I", 1);
        const auto dimC = sofa.addDim("C", numCoords);
        const auto dimM = sofa.addDim("M", numMeasurements);
        const auto dimR = sofa.addDim("R", kNumEarSides);
        const auto dimN = sofa.addDim("N", numSamples);

        auto positionVar = sofa.addVar(SofaVar::kSourcePosition, netCDF::ncDouble,
                                       std::vector<netCDF::NcDim>{dimM, dimC});
        positionVar.putAtt("Type", "spherical");
        positionVar.putAtt("Units", "degree, degree, metre");
        positionVar.putVar(positions.data());

        auto irVar = sofa.addVar(SofaVar::kDataIR, netCDF::ncDouble,
                                 std::vector<netCDF::NcDim>{dimM, dimR, dimN});
        irVar.putVar(ir.data());

        auto rateVar = sofa.addVar(SofaVar::kSamplingRate, netCDF::ncDouble, dimI);
        rateVar.putAtt("Units", "hertz");
        rateVar.putVar(&dataset.samplingRate);
    } catch (const netCDF::exceptions::NcException& e) {
        return juce::Result::fail("cannot write " + file.getFullPathName() + ": " + e.what());
    }

    return juce::Result::ok();
}

}  // namespace sofa2hrir
