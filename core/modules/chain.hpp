#pragma once

#include "module.hpp"

namespace rigcx::core::modules {

// Linear chain of deform joints, each child of the previous one, with one FK control per joint.
class Chain : public RigModule {
public:
    Chain();

    static const fields::FieldSchema& schema();

    fields::IntField chainLength{store, "chain_length"};
    fields::FloatField jointSpacing{store, "joint_spacing"};

    const std::string& typeId() const override;

    void initialize() override;
    void update() override;
    void build() override;

private:
    NodeRef addChainJoint();
    void updateChainLength();
};

} // namespace rigcx::core::modules
