#include "chapters.h"
#include "folio/primitives.h"

namespace folio {
namespace chapters {

ChapterOutput build_executive_summary(const StyleConstants& style) {
    return {
        chapter_heading("Executive Summary"),

        p("The Momentum Open Source SEZ Stack is a software system for instantiating "
          "cryptographically auditable, compliance-enforcing Special Economic Zones. This "
          "specification documents its technical architecture across its Parts and appendices."),

        p("The architecture enforces a strict separation between two systems. Mass provides five "
          "jurisdiction-agnostic programmable primitives (Entities, Ownership, Fiscal, Identity, "
          "Consent) deployed as live production APIs. The MSEZ Stack is the jurisdictional "
          "orchestration layer that makes those primitives compliance-aware through a compliance "
          "tensor, the pack trilogy, the corridor system and verifiable credentials."),

        p_runs({
            bold("Central invariant. "),
            "Mass owns business object CRUD; the MSEZ Stack owns jurisdictional context, compliance "
            "evaluation and cryptographic attestation.",
        }),

        h3("Key Capabilities"),
        table(style,
              {"Module Family", "Description", "Key Components"},
              {
                  {"Compliance", "Multi-dimensional compliance representation", "Tensor V2, Manifold, ZK proofs"},
                  {"Corridors", "Inter-jurisdiction relationships", "State sync, bridge protocol, multilateral"},
                  {"Governance", "Zone governance structures", "Constitutional frameworks, voting"},
                  {"Financial", "Banking and payment infrastructure", "Accounts, payments, custody, FX"},
                  {"Licensing", "Business authorization", "Applications, monitoring, portability"},
                  {"Settlement", "ZK-native L1 settlement", "MASS Protocol, Plonky3 proofs"},
              }),

        rule(),
    };
}

}  // namespace chapters
}  // namespace folio
