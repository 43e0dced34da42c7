/// @file samples.hpp
/// @brief Sample document pairs shared by the demos and the scenario tests.

#pragma once

#include <array>
#include <string_view>

namespace redline_cpp::samples {

struct Sample {
    std::string_view name;
    std::string_view label;
    std::string_view original;
    std::string_view modified;
};

inline constexpr auto safety_equipment = Sample{
    "safety-equipment",
    "Safety equipment list",
    R"(
<p>Safety equipment required:</p>
<ul>
  <li>Hard hat (Class G)</li>
  <li>Safety goggles</li>
  <li>Steel-toed boots</li>
</ul>
)",
    R"(
<p>Safety equipment required:</p>
<ul>
  <li>Hard hat (Class E or G)</li>
  <li>Safety goggles (Anti-fog)</li>
</ul>
)",
};

inline constexpr auto fire_exit = Sample{
    "fire-exit",
    "Fire exit procedure",
    R"(
<h2>Fire exit procedure</h2>
<ol>
  <li>Stay calm and do not run.</li>
  <li>Use the nearest exit.</li>
  <li>Do not use the elevators.</li>
</ol>
)",
    R"(
<h2>Fire exit procedure</h2>
<ol>
  <li>Stay calm and walk quickly.</li>
  <li>Use the nearest marked exit.</li>
  <li>Do not use the elevators.</li>
  <li>Gather at the assembly point.</li>
</ol>
)",
};

inline constexpr auto concrete_mix = Sample{
    "concrete-mix",
    "Concrete mix specification",
    R"(
<p>Concrete mix specification:</p>
<ul>
  <li>Cement: C25/30</li>
  <li>Aggregate size: 10mm</li>
  <li>Slump: 80mm</li>
</ul>
)",
    R"(
<p>Concrete mix specification:</p>
<ul>
  <li>Cement: C30/37</li>
  <li>Aggregate size: 10)" "\xE2\x80\x93" R"(14mm</li>
  <li>Slump: 80mm )" "\xC2\xB1" R"( 20mm</li>
  <li>Admixture: Plasticizer (as per supplier recommendations)</li>
</ul>
)",
};

inline constexpr auto long_procedure = Sample{
    "long-procedure",
    "Long procedure with few edits",
    R"(
<h2>Inspection procedure</h2>
<ol>
  <li>Check PPE is worn correctly.</li>
  <li>Verify access routes are clear.</li>
  <li>Inspect scaffolding connections.</li>
  <li>Confirm guardrails are in place.</li>
  <li>Check signage is visible.</li>
  <li>Verify fire extinguishers are accessible.</li>
  <li>Check lighting levels in all areas.</li>
  <li>Confirm emergency exits are unlocked.</li>
  <li>Record observations in the logbook.</li>
</ol>
)",
    R"(
<h2>Inspection procedure</h2>
<ol>
  <li>Check PPE is worn correctly.</li>
  <li>Verify access routes are clear.</li>
  <li>Inspect scaffolding connections.</li>
  <li>Confirm guardrails are in place.</li>
  <li>Check signage is visible.</li>
  <li>Verify fire extinguishers are accessible.</li>
  <li>Check lighting levels in all areas (lux meter if available).</li>
  <li>Confirm emergency exits are unlocked.</li>
  <li>Record observations in the digital logbook.</li>
</ol>
)",
};

inline constexpr auto nested_structure = Sample{
    "nested-structure",
    "Nested HTML structures",
    R"(
    <div>
      <h2>Safety</h2>
      <p><strong>Workers</strong> must wear PPE.</p>
      <ul>
        <li>Hard hat</li>
        <li>Goggles</li>
      </ul>
    </div>
  )",
    R"(
    <div>
      <h2>Safety requirements</h2>
      <p><strong>All workers</strong> must wear PPE at all times.</p>
      <ul>
        <li>Hard hat (Class E or G)</li>
        <li>Goggles (Anti-fog)</li>
      </ul>
    </div>
  )",
};

// Different shapes on each side: diffs as a single paragraph.
inline constexpr auto paragraph_to_list = Sample{
    "p-to-list",
    "Paragraph vs list",
    R"(
    <p>Safety equipment required: Hard hat, goggles, boots.</p>
  )",
    R"(
    <ul>
      <li>Hard hat</li>
      <li>Goggles</li>
      <li>Boots</li>
    </ul>
  )",
};

inline constexpr auto all = std::array{
    safety_equipment, fire_exit, concrete_mix, long_procedure, nested_structure, paragraph_to_list,
};

}  // namespace redline_cpp::samples
