#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

#include "scadhost/assets/asset_resolver.h"
#include "scadhost/assets/asset_response.h"
#include "scadhost/assets/async_asset_reader.h"
#include "scadhost/async/event_loop.h"

namespace fs = std::filesystem;

namespace {
    using scadhost::assets::AssetLookup;
    using scadhost::assets::AssetResolver;
    using scadhost::assets::FileAssetResponse;
    using scadhost::assets::LookupStatus;

    bool ExpectTrue(bool condition, const std::string &message) {
        if (!condition) {
            std::cout << "    assertion failed: " << message << std::endl;
        }
        return condition;
    }

    // Three search dirs shaped like a kernel install: dist, dist/wasm, vfs dist
    struct AssetTree {
        fs::path root;
        fs::path dist;
        fs::path wasm;
        fs::path vfs;

        AssetTree() {
            root = fs::temp_directory_path() / ("scadhost-assets-" + std::to_string(::getpid()) + "-" +
                                                std::to_string(counter++));
            dist = root / "dist";
            wasm = dist / "wasm";
            vfs = root / "vfs";
            fs::create_directories(wasm);
            fs::create_directories(vfs);
        }

        ~AssetTree() {
            std::error_code ec;
            fs::remove_all(root, ec);
        }

        std::vector<std::string> dirs() const {
            return {dist.string(), wasm.string(), vfs.string()};
        }

        static void write(const fs::path &path, const std::string &content) {
            std::ofstream out(path, std::ios::binary);
            out << content;
        }

        static int counter;
    };

    int AssetTree::counter = 0;

    bool ResourceNameStripsUrlDecoration() {
        bool ok = ExpectTrue(AssetResolver::resourceName("openscad.wasm") == "openscad.wasm", "Bare name");
        ok &= ExpectTrue(AssetResolver::resourceName("file:///opt/kernel/dist/openscad.wasm") == "openscad.wasm",
                         "file:// scheme stripped");
        ok &= ExpectTrue(AssetResolver::resourceName("https://scadhost.invalid/wasm/openscad.js?v=3#top") == "openscad.js",
                         "Query and fragment stripped");
        ok &= ExpectTrue(AssetResolver::resourceName("C:\\kernel\\dist\\fonts.zip") == "fonts.zip",
                         "Backslashes normalized");
        ok &= ExpectTrue(AssetResolver::resourceName("/dist/libraries/") == "libraries", "Trailing separator stripped");
        ok &= ExpectTrue(AssetResolver::resourceName("/dist/my%20font.ttf") == "my font.ttf", "Percent decoded");
        return ok;
    }

    bool ResourceNameRefusesTraversal() {
        bool ok = ExpectTrue(AssetResolver::resourceName("").empty(), "Empty request");
        ok &= ExpectTrue(AssetResolver::resourceName("/").empty(), "Root only");
        ok &= ExpectTrue(AssetResolver::resourceName("..").empty(), "Parent directory");
        ok &= ExpectTrue(AssetResolver::resourceName("dist/.").empty(), "Current directory");
        ok &= ExpectTrue(AssetResolver::resourceName("dist/%2e%2e").empty(), "Encoded parent directory");
        ok &= ExpectTrue(AssetResolver::resourceName("dist/a%2fb").empty(), "Encoded separator");
        return ok;
    }

    bool LookupSearchesDirectoriesInOrder() {
        AssetTree tree;
        AssetTree::write(tree.wasm / "openscad.wasm", "wasm-dir");
        AssetTree::write(tree.vfs / "openscad.wasm", "vfs-dir");
        AssetTree::write(tree.vfs / "browserfs.min.js", "vfs-only");

        AssetResolver resolver(tree.dirs());
        AssetLookup wasm = resolver.lookup("https://scadhost.invalid/openscad.wasm");
        bool ok = ExpectTrue(wasm.found(), "Wasm found");
        ok &= ExpectTrue(std::string(wasm.bytes.begin(), wasm.bytes.end()) == "wasm-dir", "Earlier dir wins");
        ok &= ExpectTrue(wasm.candidates.size() == 2, "Stopped at first match");

        AssetLookup vfsOnly = resolver.lookup("browserfs.min.js");
        ok &= ExpectTrue(vfsOnly.found() && vfsOnly.path == (tree.vfs / "browserfs.min.js").string(),
                         "Last dir consulted");
        return ok;
    }

    bool MissingAssetYieldsEmptySentinel() {
        AssetTree tree;
        fs::create_directories(tree.dist / "openscad.data");  // directories are skipped
        AssetResolver resolver(tree.dirs());

        AssetLookup missing = resolver.lookup("openscad.data");
        bool ok = ExpectTrue(missing.status == LookupStatus::NotFound, "NotFound status");
        ok &= ExpectTrue(missing.bytes.empty(), "Empty body");
        ok &= ExpectTrue(missing.candidates.size() == 3, "Every dir tried");

        FileAssetResponse response(missing);
        ok &= ExpectTrue(response.ok(), "Not found is still ok");
        ok &= ExpectTrue(response.status() == 200, "Not found is status 200");
        ok &= ExpectTrue(response.body().empty() && response.text().empty(), "Zero-length body");

        AssetLookup traversal = resolver.lookup("../../etc/passwd/..");
        ok &= ExpectTrue(traversal.status == LookupStatus::NotFound && traversal.candidates.empty(),
                         "Traversal never touches the filesystem");
        return ok;
    }

    bool UnreadableCandidateIsIoError() {
        AssetTree tree;
        // A self-referencing symlink fails stat with ELOOP, even for root
        std::error_code ec;
        fs::create_symlink(tree.dist / "fonts.conf", tree.dist / "fonts.conf", ec);
        bool ok = ExpectTrue(!ec, "Symlink created");

        AssetResolver resolver(tree.dirs());
        AssetLookup lookup = resolver.lookup("fonts.conf");
        ok &= ExpectTrue(lookup.status == LookupStatus::IoError, "IoError status");
        ok &= ExpectTrue(!lookup.error.empty(), "Error text kept");

        FileAssetResponse response(lookup);
        ok &= ExpectTrue(!response.ok(), "Response not ok");
        ok &= ExpectTrue(response.status() == 500, "Status 500");
        ok &= ExpectTrue(response.statusText() == lookup.error, "Status text carries the error");
        return ok;
    }

    bool ResponseCloneIsIndependent() {
        AssetTree tree;
        AssetTree::write(tree.dist / "openscad.js", "loader");
        AssetResolver resolver(tree.dirs());

        FileAssetResponse response(resolver.lookup("/dist/openscad.js"));
        auto copy = response.clone();
        bool ok = ExpectTrue(copy != nullptr, "Clone created");
        if (copy) {
            ok &= ExpectTrue(copy->text() == "loader", "Clone body");
            ok &= ExpectTrue(copy->url() == "/dist/openscad.js", "Clone url");
            ok &= ExpectTrue(copy->body().data() != response.body().data(), "Clone owns its bytes");
        }
        ok &= ExpectTrue(response.statusText() == "OK", "Found status text");
        return ok;
    }

    bool AsyncReaderCompletesOnLoopThread() {
        AssetTree tree;
        AssetTree::write(tree.wasm / "openscad.wasm", std::string("\0asm", 4));

        scadhost::async::EventLoop loop;
        bool ok = ExpectTrue(loop.init(), "Loop initialized");
        AssetResolver resolver(tree.dirs());
        scadhost::assets::AsyncAssetReader reader(loop, resolver);

        std::vector<AssetLookup> results;
        reader.lookup("openscad.wasm", [&results](AssetLookup result) { results.push_back(std::move(result)); });
        reader.lookup("missing.bin", [&results](AssetLookup result) { results.push_back(std::move(result)); });
        ok &= ExpectTrue(reader.inFlight() == 2, "Two lookups in flight");

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (results.size() < 2 && std::chrono::steady_clock::now() < deadline) {
            loop.runOnce();
            reader.processCompleted();
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }

        ok &= ExpectTrue(results.size() == 2, "Both lookups completed");
        ok &= ExpectTrue(reader.inFlight() == 0, "Nothing in flight");
        int found = 0;
        for (const auto &result: results) {
            if (result.found()) {
                found++;
                ok &= ExpectTrue(result.bytes.size() == 4, "Binary content intact");
            }
        }
        ok &= ExpectTrue(found == 1, "Exactly one found");
        loop.shutdown();
        return ok;
    }

    struct TestCase {
        const char *name;

        bool (*fn)();
    };
}

int main() {
    std::vector<TestCase> tests{
        {"ResourceNameStripsUrlDecoration", ResourceNameStripsUrlDecoration},
        {"ResourceNameRefusesTraversal", ResourceNameRefusesTraversal},
        {"LookupSearchesDirectoriesInOrder", LookupSearchesDirectoriesInOrder},
        {"MissingAssetYieldsEmptySentinel", MissingAssetYieldsEmptySentinel},
        {"UnreadableCandidateIsIoError", UnreadableCandidateIsIoError},
        {"ResponseCloneIsIndependent", ResponseCloneIsIndependent},
        {"AsyncReaderCompletesOnLoopThread", AsyncReaderCompletesOnLoopThread}
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
