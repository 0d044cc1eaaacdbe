#include "InstrumentDrivers.h"
#include "ScpiScope.h"
#include "DDSGenerator.h"
#include "SourceMeter.h"
#include "SimulatedInstruments.h"
#include <QDebug>

namespace {

class HardwareInstrumentFactory : public InstrumentFactory {
public:
    std::unique_ptr<ScopeDriver> createScope() override {
        return std::make_unique<ScpiScope>();
    }
    std::unique_ptr<GeneratorDriver> createGenerator() override {
        return std::make_unique<DDSGenerator>();
    }
    std::unique_ptr<OutputSwitchDriver> createOutputSwitch() override {
        return std::make_unique<SourceMeter>();
    }
};

class SimulatedInstrumentFactory : public InstrumentFactory {
public:
    std::unique_ptr<ScopeDriver> createScope() override {
        return std::make_unique<SimulatedScope>(bench);
    }
    std::unique_ptr<GeneratorDriver> createGenerator() override {
        return std::make_unique<SimulatedGenerator>(bench);
    }
    std::unique_ptr<OutputSwitchDriver> createOutputSwitch() override {
        return std::make_unique<SimulatedOutputSwitch>(bench);
    }

private:
    std::shared_ptr<SimulatedBench> bench = std::make_shared<SimulatedBench>();
};

}

std::unique_ptr<InstrumentFactory> createInstrumentFactory(const QString &backend) {
    const QString name = backend.trimmed().toLower();
    if (name == "hardware") return std::make_unique<HardwareInstrumentFactory>();
    if (name == "simulated") return std::make_unique<SimulatedInstrumentFactory>();
    qWarning() << "[InstrumentFactory] Unknown backend" << backend;
    return nullptr;
}
