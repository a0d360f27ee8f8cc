#pragma once
#include "module.h"
#include "config.h"
#include "variable.h"
#include "data/dataset.h"
#include <memory>

namespace tinyformer {

// Base of the three model variants. Holds the validated config and exposes
// the shifted-target loss the trainer minimises.
class SequenceModel : public Module {
    protected:
        ModelConfig config;
    public:
        explicit SequenceModel(const ModelConfig& config);

        virtual std::shared_ptr<Variable> loss(const Example& example) const = 0;

        const ModelConfig& getConfig() const { return config; }
};

} // namespace tinyformer
