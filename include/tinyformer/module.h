#pragma once
#include <vector>
#include <memory>
#include "variable.h"

namespace tinyformer {

class Module {
    protected:
        std::vector<std::shared_ptr<Variable>> parameters;

        void registerParameter(const std::shared_ptr<Variable>& param) {
            parameters.push_back(param);
        }

        void registerModule(const Module& child) {
            for (const auto& param : child.getParameters()) {
                parameters.push_back(param);
            }
        }
    public:
        Module() = default;
        virtual ~Module() = default;

        Module(const Module&) = delete;
        Module& operator=(const Module&) = delete;

        virtual std::vector<std::shared_ptr<Variable>> getParameters() const {
            return parameters;
        }
};

} // namespace tinyformer
