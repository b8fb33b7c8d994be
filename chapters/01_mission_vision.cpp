#include "chapters.h"
#include "folio/primitives.h"

namespace folio {
namespace chapters {

ChapterOutput build_mission_vision(const StyleConstants&) {
    return {
        part_heading("PART I: FOUNDATION"),

        chapter_heading("Chapter 1: Mission and Vision"),

        p("The Momentum EZ Stack decomposes economic governance into modular, composable "
          "primitives. A jurisdiction selects a deployment profile, imports its legal corpus as "
          "machine-readable packs, and deploys the stack to yield a zone that processes entity "
          "formation, enforces tax law, clears securities, and manages trade corridors."),

        h2("1.1 The Programmable Institution Thesis"),

        p("A programmable institution encodes its rules in machine-executable form, enforces them "
          "through cryptographic mechanisms, and provides mathematical guarantees about compliance "
          "state. The following deployments validate this model."),

        table({"Deployment", "Status", "Evidence"},
              {
                  {"Pakistan GovOS (PDA)", "Active", "Full government OS: 40+ ministries, FBR tax integration, SBP Raast payments, NADRA identity, SECP corporate registry."},
                  {"UAE / ADGM", "Live", "1,000+ entities onboarded, $1.7B+ capital processed via Northern Trust custody."},
                  {"Dubai Free Zone Council", "Integration", "27 free zones. Mass APIs serve entity + fiscal; MEZ provides zone-specific licensing."},
                  {"Kazakhstan (Alatau City)", "Partnership", "SEZ + AIFC integration. Tests composition engine: Kazakh law + AIFC financial regulation."},
                  {"Seychelles", "Deployment", "Sovereign GovOS at national scale."},
              },
              {2400, 1200, 5760}),

        h2("1.2 The Two-System Architecture"),

        p_runs({
            bold("System A: Mass, the five programmable primitives. "),
            "Mass provides five jurisdiction-agnostic APIs that implement the fundamental operations "
            "of economic governance: creating legal entities, managing ownership, processing "
            "payments, verifying identity, and recording consent.",
        }),

        table({"Primitive", "Live API Surface", "Function"},
              {
                  {"Entities", "organization-info.api.mass.inc", "Formation, lifecycle, dissolution."},
                  {"Ownership", "investment-info", "Cap tables, beneficial ownership, fundraising rounds."},
                  {"Fiscal", "treasury-info.api.mass.inc", "Accounts, wallets, payments, withholding tax at source."},
                  {"Identity", "Distributed across org + consent", "Passportable KYC/KYB. Onboard once, reuse everywhere."},
                  {"Consent", "consent.api.mass.inc", "Multi-party auth, audit trails, sign-off workflows."},
              },
              {1800, 3200, 4360}),

        p_runs({
            bold("System B: MEZ Stack, the jurisdictional context. "),
            "The MEZ Stack sits above Mass and provides the legal, regulatory, compliance and "
            "corridor infrastructure that turns generic primitive operations into "
            "jurisdiction-aware ones.",
        }),

        p_runs({
            bold("The Interface Contract. "),
            "The MEZ Stack defines what is permitted, required and prohibited in each jurisdiction. "
            "Mass executes the permitted operations. The Stack never duplicates Mass CRUD "
            "operations; it enriches them with ",
            italic("compliance context"),
            ".",
        }),
    };
}

}  // namespace chapters
}  // namespace folio
