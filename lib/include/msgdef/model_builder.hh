//
// Created by igor on 05/12/2025.
//

#pragma once

#include "early_model.hh"
#include "model.hh"
#include <vector>

namespace msgdef::semantic {
    /// Builds the Model from early models that completed the transform pipeline,
    /// given in dependency order (imports first).
    ///
    /// Binds every QFN to its entity, merges enum inheritance, computes enum bit
    /// widths, reduces default values and validates uniqueness, resolvability and
    /// acyclic inheritance. All errors are collected; the model is returned only
    /// if there is none.
    ///
    /// Throws pipeline_error if a namespace was never assigned a QFN.
    build_result build_model(const std::vector<const early::early_model*>& files);
}
