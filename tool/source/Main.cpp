#include <Sofa2Hrir/ConsoleLogger.h>
#include <Sofa2Hrir/ConversionConfig.h>
#include <Sofa2Hrir/ConversionPipeline.h>
#include <utility>

namespace {

void runConversion(const juce::ArgumentList& args) {
    using namespace sofa2hrir;

    juce::StringArray paths;
    auto result = getInputOutputPaths(args, paths);
    if (result.failed())
        juce::ConsoleApplication::fail(result.getErrorMessage(), 1);

    ConversionConfig config;
    result = parseConversionOptions(args, config);
    if (result.failed())
        juce::ConsoleApplication::fail(result.getErrorMessage(), 1);

    ConsoleLogger logger(config.verbose);
    ScopedCurrentLogger scopedLogger(&logger);

    const ConversionPipeline pipeline(std::move(config));
    result = pipeline.convertFile(resolveUserPath(paths[0]), resolveUserPath(paths[1]));
    if (result.failed())
        juce::ConsoleApplication::fail(result.getErrorMessage(), 1);
}

}  // namespace

int main(int argc, char* argv[]) {
    juce::ConsoleApplication app;

    app.addHelpCommand("--help|-h", juce::String(sofa2hrir::kUsageMessage) + " [options]", false);

    app.addDefaultCommand({"",
                           "<input.sofa> <output.hrir> [options]",
                           "Converts a SOFA HRIR set into first-order ambisonic coefficients",
                           "Options:\n"
                           "  --layout=tetrahedron|cube  virtual speaker grid (default tetrahedron)\n"
                           "  --decoder=transpose|pinv   decode matrix (default depends on layout)\n"
                           "  --gain=<linear>            gain compensation (default 10)\n"
                           "  --gain-db=<dB>             gain compensation in decibels\n"
                           "  --feeds=hinted|nearest     tetrahedral feed resolution (default hinted)\n"
                           "  --tolerance=<degrees>      max feed direction deviation (default 1)\n"
                           "  --verify                   re-read the written file\n"
                           "  --verbose                  debug logging",
                           runConversion});

    return app.findAndRunCommand(argc, argv);
}
