#include "AbTestApplication.h"
#include <exception>
#include <vector>
#include "AbStatsException.h"
#include "AbTests.h"
#include "ObservationFileReader.h"
#include "OutputUtils.h"
#include "ResultFormatter.h"

namespace abstats
{
namespace cli
{

AbTestApplication::AbTestApplication(const AbTestConfiguration& config)
    : mConfig(config)
{
}

AbTestResult AbTestApplication::compute() const
{
    const AbTestOptions options = mConfig.toTestOptions();

    if (mConfig.getCommand() == AbCommand::Proportion)
    {
        const ProportionCounts& c = mConfig.getProportionCounts();
        return proportionsZTest(c.controlN, c.controlSuccess, c.treatmentN, c.treatmentSuccess, options);
    }

    const std::vector<double> control = io::ObservationFileReader::readFile(mConfig.getControlFile());
    const std::vector<double> treatment = io::ObservationFileReader::readFile(mConfig.getTreatmentFile());
    return welchTTest(control, treatment, options);
}

void AbTestApplication::logSummary(std::ostream& log, const AbTestResult& result) const
{
    log << "command: " << AbTestConfiguration::commandName(mConfig.getCommand())
        << ", alpha: " << mConfig.getAlpha()
        << ", power: " << mConfig.getPower();
    if (mConfig.getAllocationRatio())
        log << ", allocation ratio: " << *mConfig.getAllocationRatio();
    log << std::endl;

    log << "control:   n=" << result.control.getCount()
        << " estimate=" << result.control.getEstimate()
        << " variance=" << result.control.getVariance() << std::endl;
    log << "treatment: n=" << result.treatment.getCount()
        << " estimate=" << result.treatment.getEstimate()
        << " variance=" << result.treatment.getVariance() << std::endl;
    log << "critical value: " << result.criticalValue << std::endl;

    if (!result.deltaRelative)
        log << "relative change undefined: control estimate is zero" << std::endl;
    if (!result.mssPosthoc)
        log << "post-hoc sample size undefined: zero observed effect or zero variance" << std::endl;
}

int AbTestApplication::run(std::ostream& out, std::ostream& err) const
{
    try
    {
        utils::LogSink sink(out, mConfig.getLogFile());
        std::ostream& log = sink.stream();

        const AbTestResult result = compute();

        if (mConfig.isVerbose())
            logSummary(log, result);

        if (mConfig.getOutputFormat() == OutputFormat::Csv)
            reporting::ResultFormatter::writeCsv(log, result);
        else
            reporting::ResultFormatter::writeTable(log, result);

        log.flush();
        return kExitSuccess;
    }
    catch (const ValidationError& e)
    {
        err << "Invalid input: " << e.what() << std::endl;
        return kExitInvalidInput;
    }
    catch (const ConfigurationError& e)
    {
        err << "Configuration error: " << e.what() << std::endl;
        return kExitInvalidInput;
    }
    catch (const InputFileError& e)
    {
        err << "Input error: " << e.what() << std::endl;
        return kExitInvalidInput;
    }
    catch (const DegenerateVarianceError& e)
    {
        err << "Degenerate data: " << e.what() << std::endl;
        return kExitNumericalFailure;
    }
    catch (const ConvergenceError& e)
    {
        err << "Numerical failure: " << e.what() << std::endl;
        return kExitNumericalFailure;
    }
    catch (const DomainError& e)
    {
        err << "Domain error: " << e.what() << std::endl;
        return kExitNumericalFailure;
    }
    catch (const std::exception& e)
    {
        err << "Unexpected error: " << e.what() << std::endl;
        return kExitUnexpectedError;
    }
}

} // namespace cli
} // namespace abstats
