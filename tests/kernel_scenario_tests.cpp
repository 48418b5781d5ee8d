#include <csignal>
#include <iostream>
#include <string>
#include <vector>
#include <cstdint>

#include "scadhost/config.h"
#include "scadhost/job/job_coordinator.h"
#include "scadhost/protocol/errors.h"

#ifndef SCADHOST_TEST_WORKER
#define SCADHOST_TEST_WORKER "scadhost-worker"
#endif

// Scenarios against the real openscad-playground kernel. The kernel is
// located through SCADHOST_KERNEL_ROOT (or the compiled-in default); the
// suite is skipped when it is not installed.

namespace {
    using scadhost::job::JobCoordinator;
    using scadhost::job::JobOutcome;
    using scadhost::protocol::ErrorKind;

    bool ExpectTrue(bool condition, const std::string &message) {
        if (!condition) {
            std::cout << "    assertion failed: " << message << std::endl;
        }
        return condition;
    }

    scadhost::Config KernelConfig() {
        scadhost::Config config = scadhost::Config::fromEnvironment();
        config.workerExecutable = SCADHOST_TEST_WORKER;
        return config;
    }

    uint32_t ReadLe32(const std::vector<uint8_t> &bytes, size_t offset) {
        return static_cast<uint32_t>(bytes[offset]) |
               (static_cast<uint32_t>(bytes[offset + 1]) << 8) |
               (static_cast<uint32_t>(bytes[offset + 2]) << 16) |
               (static_cast<uint32_t>(bytes[offset + 3]) << 24);
    }

    bool CubeRendersBinaryStl() {
        JobCoordinator coordinator(KernelConfig());
        JobOutcome outcome = coordinator.execute("cube([10,10,10]);");
        bool ok = ExpectTrue(outcome.error == ErrorKind::None,
                             std::string("Cube renders: ") + scadhost::protocol::errorKindName(outcome.error) +
                             " " + outcome.message);
        ok &= ExpectTrue(outcome.outputPath == "output.stl", "First output path is output.stl");
        ok &= ExpectTrue(outcome.bytes.size() > 84, "More than a bare STL header");
        if (outcome.bytes.size() > 84) {
            // 80-byte header, triangle count, 50 bytes per triangle
            uint32_t triangles = ReadLe32(outcome.bytes, 80);
            ok &= ExpectTrue(triangles == 12, "A cube has 12 triangles");
            ok &= ExpectTrue(outcome.bytes.size() == 84 + 50 * static_cast<size_t>(triangles), "Size matches count");
        }
        return ok;
    }

    bool DanglingBraceIsKernelError() {
        JobCoordinator coordinator(KernelConfig());
        JobOutcome outcome = coordinator.execute("cube([10,10,10]);\n{");
        bool ok = ExpectTrue(outcome.error == ErrorKind::WorkerReportedError,
                             std::string("Syntax error reported by the kernel: ") +
                             scadhost::protocol::errorKindName(outcome.error));
        ok &= ExpectTrue(!outcome.message.empty(), "Kernel diagnostic kept");
        return ok;
    }

    bool IdenticalRunsAreIndependent() {
        JobCoordinator coordinator(KernelConfig());
        JobOutcome first = coordinator.execute("sphere(r=5, $fn=16);");
        JobOutcome second = coordinator.execute("sphere(r=5, $fn=16);");
        bool ok = ExpectTrue(first.error == ErrorKind::None && second.error == ErrorKind::None, "Both runs succeed");
        ok &= ExpectTrue(coordinator.spawnCount() == 2, "Two workers");
        ok &= ExpectTrue(first.bytes.size() == second.bytes.size(), "Same geometry size");
        return ok;
    }

    struct TestCase {
        const char *name;

        bool (*fn)();
    };
}

int main() {
    std::signal(SIGPIPE, SIG_IGN);

    std::string error;
    if (!KernelConfig().validate(error)) {
        std::cout << "[SKIP] kernel scenarios: " << error << std::endl;
        return 0;
    }

    std::vector<TestCase> tests{
        {"CubeRendersBinaryStl", CubeRendersBinaryStl},
        {"DanglingBraceIsKernelError", DanglingBraceIsKernelError},
        {"IdenticalRunsAreIndependent", IdenticalRunsAreIndependent}
    };

    std::size_t passed = 0;
    for (const auto &test: tests) {
        std::cout << "Running " << test.name << std::endl;
        if (test.fn()) {
            ++passed;
            std::cout << "  [PASS]" << std::endl;
        } else {
            std::cout << "  [FAIL]" << std::endl;
            std::cout << "Executed " << passed << " / " << tests.size() << " tests" << std::endl;
            return 1;
        }
    }

    std::cout << "Executed " << passed << " / " << tests.size() << " tests" << std::endl;
    return 0;
}
