#pragma once

#include "puid/core/clock.h"
#include "puid/core/process_id.h"
#include "puid/core/random_source.h"
#include "puid/core/sequence_counter.h"

namespace puid::generator {

// GeneratorServices is the composition root for one IdGenerator.
// It holds references (not ownership) to the four collaborators. Whoever creates
// the concrete instances is responsible for keeping them alive longer than the
// generator.
struct GeneratorServices {
  core::IClock& clock;                     // NOLINT(readability-identifier-naming)
  core::SequenceCounter& counter;          // NOLINT(readability-identifier-naming)
  core::IProcessIdSource& process_ids;     // NOLINT(readability-identifier-naming)
  core::IRandomSource& random;             // NOLINT(readability-identifier-naming)

  GeneratorServices(core::IClock& clock, core::SequenceCounter& counter,
                    core::IProcessIdSource& process_ids, core::IRandomSource& random)
      : clock(clock), counter(counter), process_ids(process_ids), random(random) {}

  ~GeneratorServices() = default;

  // Prevent copying and moving to avoid accidental lifetime issues
  GeneratorServices(const GeneratorServices&) = delete;
  GeneratorServices& operator=(const GeneratorServices&) = delete;
  GeneratorServices(GeneratorServices&&) = delete;
  GeneratorServices& operator=(GeneratorServices&&) = delete;
};

}  // namespace puid::generator
