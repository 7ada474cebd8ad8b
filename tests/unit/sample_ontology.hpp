#pragma once

#include "ontology/ontology.hpp"
#include <nlohmann/json.hpp>

namespace atlas {
namespace fixtures {

// Small knowledge graph shared by the navigator and explorer tests.
//
//   t1 -requiresCapability-> c1, c2 (c-missing is dangling)
//   c1 -implementedByAdapter-> a1, -implementedByIntrinsic-> i1, -isPartOf-> g1
//   c2 -implementedByIntrinsic-> i2
//   g1 -hasPart-> c1, c2 ; -belongsToDomain-> dom1
//   r1 -isDetectedBy-> ctl1, -hasRelatedAction-> act1, SKOS -> r2, r3
//   t2 and Capability "shared" share an id with a Documentation record
inline nlohmann::json sample_ontology_json() {
    return nlohmann::json::parse(R"({
        "aitasks": [
            {"id": "t1", "name": "Question answering",
             "requiresCapability": ["c1", "c2", "c-missing"],
             "hasRelatedLLMIntrinsic": "i1",
             "hasDocumentation": "d1"},
            {"id": "t2", "name": "Summarization",
             "requiresCapability": ["shared"],
             "hasDocumentation": ["shared"]}
        ],
        "capabilities": [
            {"id": "c1", "name": "Cap one", "isDefinedByTaxonomy": "tax-a",
             "requiredByTask": ["t1"],
             "implementedByAdapter": ["a1"],
             "implementedByIntrinsic": ["i1"],
             "isPartOf": "g1",
             "closeMatch": ["c2"]},
            {"id": "c2", "name": "Cap two", "isDefinedByTaxonomy": "tax-b",
             "requiredByTask": ["t1"],
             "implementedByIntrinsic": ["i2"],
             "isPartOf": "g1"},
            {"id": "shared", "name": "Shared id capability"}
        ],
        "llmintrinsics": [
            {"id": "i1", "implementsCapability_intrinsic": ["c1"]},
            {"id": "i2", "implementsCapability_intrinsic": ["c2"]}
        ],
        "adapters": [
            {"id": "a1", "implementsCapability_adapter": ["c1"]}
        ],
        "capabilitygroups": [
            {"id": "g1", "hasPart": ["c1", "c2"], "belongsToDomain": "dom1"}
        ],
        "capabilitydomains": [
            {"id": "dom1", "hasPart": ["g1"]}
        ],
        "risks": [
            {"id": "r1", "isDefinedByTaxonomy": "risk-tax",
             "isDetectedBy": ["ctl1"],
             "hasRelatedAction": ["act1"],
             "closeMatch": ["r2"],
             "exactMatch": "r3"},
            {"id": "r2", "isDefinedByTaxonomy": "risk-tax", "relatedMatch": ["r1"]},
            {"id": "r3", "isDefinedByTaxonomy": "other-tax"}
        ],
        "riskcontrols": [{"id": "ctl1"}],
        "actions": [{"id": "act1"}],
        "documents": [
            {"id": "d1", "name": "Task card"},
            {"id": "shared", "name": "Shared id document"}
        ]
    })");
}

inline Ontology sample_ontology() {
    return Ontology::from_json(sample_ontology_json());
}

}  // namespace fixtures
}  // namespace atlas
