/**
 * Collection Generation Example
 *
 * Builds a small catalog of procedurally drawn trait images, runs it through
 * the worker pool and writes every artifact to disk:
 * - <output>/images/<n>.png
 * - <output>/metadata/<n>.json
 *
 * Usage: generate_collection [--count=N] [--output=DIR] [--workers=N]
 */

#include <traitforge/orchestrator.hpp>
#include <traitforge/stb_codec.hpp>
#include <traitforge/worker.hpp>
#include <algorithm>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>

using namespace traitforge;

namespace {

struct Options {
    std::size_t count = 20;
    std::string output = "collection";
    std::size_t workers = 2;
};

bool parse_args(int argc, char** argv, Options& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--count=", 0) == 0) {
            options.count = std::strtoul(arg.c_str() + 8, nullptr, 10);
        } else if (arg.rfind("--output=", 0) == 0) {
            options.output = arg.substr(9);
        } else if (arg.rfind("--workers=", 0) == 0) {
            options.workers = std::max<std::size_t>(1, std::strtoul(arg.c_str() + 10, nullptr, 10));
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return false;
        }
    }
    return true;
}

// Draws a disc (or a full square when radius is 0) and encodes it as PNG
std::vector<std::uint8_t> draw_trait(ImageCodec& codec, std::uint32_t size, std::uint8_t r,
                                     std::uint8_t g, std::uint8_t b, double radius) {
    Surface surface(size, size);
    double centre = (size - 1) / 2.0;
    for (std::uint32_t y = 0; y < size; ++y) {
        for (std::uint32_t x = 0; x < size; ++x) {
            double dx = x - centre;
            double dy = y - centre;
            if (radius > 0 && dx * dx + dy * dy > radius * radius) continue;
            std::uint8_t* p = surface.pixel(x, y);
            p[0] = r;
            p[1] = g;
            p[2] = b;
            p[3] = 255;
        }
    }
    return codec.encode(surface, ImageFormat::Png, 90);
}

GenerationRequest build_request(ImageCodec& codec, std::size_t count) {
    const std::uint32_t size = 64;
    GenerationRequest request;
    request.count = count;
    request.output = {size, size};
    request.naming.collection_name = "Orbs";
    request.naming.description = "Coloured orbs on coloured grounds";
    request.seed = 2024;

    Layer background;
    background.id = 1;
    background.name = "Background";
    background.order = 0;
    const struct { const char* name; std::uint8_t r, g, b; double weight; } grounds[] = {
        {"Night", 20, 20, 60, 3.0}, {"Sand", 220, 200, 150, 2.0},
        {"Moss", 60, 110, 60, 2.0}, {"Gold", 240, 190, 40, 0.5},
    };
    TraitId next = 1;
    for (const auto& g : grounds) {
        Trait trait;
        trait.id = next++;
        trait.name = g.name;
        trait.rarity_weight = g.weight;
        trait.payload = draw_trait(codec, size, g.r, g.g, g.b, 0.0);
        background.traits.push_back(std::move(trait));
    }

    Layer orb;
    orb.id = 2;
    orb.name = "Orb";
    orb.order = 1;
    const struct { const char* name; std::uint8_t r, g, b; double radius; } orbs[] = {
        {"Small Red", 200, 30, 30, 12.0}, {"Large Red", 200, 30, 30, 26.0},
        {"Small Blue", 40, 80, 220, 12.0}, {"Large Blue", 40, 80, 220, 26.0},
        {"Pearl", 240, 240, 240, 18.0},
    };
    for (const auto& o : orbs) {
        Trait trait;
        trait.id = next++;
        trait.name = o.name;
        trait.payload = draw_trait(codec, size, o.r, o.g, o.b, o.radius);
        orb.traits.push_back(std::move(trait));
    }

    Layer halo;
    halo.id = 3;
    halo.name = "Halo";
    halo.order = 2;
    halo.optional = true;
    Trait ring;
    ring.id = next++;
    ring.name = "Ring";
    ring.rarity_weight = 0.5;
    ring.payload = draw_trait(codec, size, 255, 255, 180, 4.0);
    halo.traits.push_back(std::move(ring));

    // Gold grounds never carry a pearl
    Trait& gold = background.traits[3];
    gold.role = TraitRole::Ruler;
    gold.rules.push_back({orb.id, {orb.traits[4].id}, {}});

    request.layers = {std::move(background), std::move(orb), std::move(halo)};
    request.groups.push_back({1, {1, 2}, true});
    return request;
}

void write_file(const std::filesystem::path& path, const void* data, std::size_t size) {
    std::ofstream out(path, std::ios::binary);
    out.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!out) {
        throw std::runtime_error("Failed to write " + path.string());
    }
}

} // namespace

int main(int argc, char** argv) {
    Options options;
    if (!parse_args(argc, argv, options)) {
        std::cerr << "Usage: generate_collection [--count=N] [--output=DIR] [--workers=N]\n";
        return 1;
    }

    std::cout << "=== Collection Generation Example ===\n\n";
    std::cout << "  Items:   " << options.count << "\n";
    std::cout << "  Output:  " << options.output << "\n";
    std::cout << "  Workers: " << options.workers << "\n\n";

    try {
        std::filesystem::path root(options.output);
        std::filesystem::create_directories(root / "images");
        std::filesystem::create_directories(root / "metadata");

        StbImageCodec codec;
        GenerationRequest request = build_request(codec, options.count);

        OrchestratorConfig config;
        config.initial_workers = options.workers;
        config.scaling.min_workers = options.workers;
        config.scaling.max_workers = options.workers;

        Orchestrator orchestrator(
            thread_worker_factory([] { return std::make_unique<StbImageCodec>(); }), config);

        std::mutex mutex;
        std::condition_variable done_cv;
        bool done = false;
        bool ok = false;
        std::size_t written = 0;

        orchestrator.submit(std::move(request), [&](WorkerOutbound message) {
            std::visit(overloaded{
                [&](ArtifactBatchMessage& batch) {
                    for (const auto& artifact : batch.artifacts) {
                        try {
                            write_file(root / "images" / artifact.image_name, artifact.image.data(),
                                       artifact.image.size());
                            write_file(root / "metadata" / artifact.metadata_name, artifact.metadata.data(),
                                       artifact.metadata.size());
                            ++written;
                        } catch (const std::exception& e) {
                            std::cerr << "  " << e.what() << "\n";
                        }
                    }
                },
                [&](ProgressMessage& progress) {
                    std::cout << "  [" << progress.generated << "/" << progress.total << "] "
                              << progress.status << "\n";
                },
                [&](ItemFailedMessage& failed) {
                    std::cout << "  Item " << failed.index << " failed: " << failed.message << "\n";
                },
                [&](CompleteMessage& complete) {
                    std::cout << "\nGenerated " << complete.generated << " items\n";
                    std::lock_guard<std::mutex> lock(mutex);
                    done = true;
                    ok = true;
                    done_cv.notify_all();
                },
                [&](ErrorMessage& error) {
                    std::cerr << "\nGeneration failed (" << error_code_name(error.code) << "): "
                              << error.message << "\n";
                    std::lock_guard<std::mutex> lock(mutex);
                    done = true;
                    done_cv.notify_all();
                },
                [&](CancelledMessage&) {
                    std::lock_guard<std::mutex> lock(mutex);
                    done = true;
                    done_cv.notify_all();
                },
                [](auto&) {},
            }, message);
        });

        {
            std::unique_lock<std::mutex> lock(mutex);
            done_cv.wait(lock, [&] { return done; });
        }
        orchestrator.shutdown();

        std::cout << "Wrote " << written << " images and metadata files to " << root << "\n";
        return ok ? 0 : 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
