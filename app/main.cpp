#include <iostream>
#include <string>

#include "cli_common.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "mesh_kernel.hpp"
#include "mold_pipeline.hpp"

int main(int argc, char* argv[]) {
    auto log = beardmold::logging::get_logger();
    namespace cli = beardmold::cli;

    // 1. Parse command-line arguments
    cli::CommandContext ctx;
    try {
        ctx = cli::parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        cli::print_usage(argv[0]);
        return cli::EXIT_USAGE;
    }

    if (ctx.help) {
        cli::print_usage(argv[0]);
        return cli::EXIT_OK;
    }
    if (ctx.verbose) {
        beardmold::logging::enable_verbose();
    }

    log->info("Starting beardmold pipeline");
    log->info("Input file: {}", ctx.input_path);
    log->info("Output file: {}", ctx.output_path);

    try {
        // 2. Pick the mesh kernel
        auto kernel = beardmold::create_kernel(ctx.kernel_name);
        log->info("Mesh kernel: {}", kernel->name());

        // 3. Run
        beardmold::MoldPipeline pipeline(*kernel);
        beardmold::PipelineResult result = pipeline.run_file(ctx.input_path, ctx.output_path);

        if (result.features.failures() > 0) {
            log->warn("{} feature requests were skipped", result.features.failures());
        }

        std::cout << beardmold::format_summary(result) << std::endl;
        return cli::EXIT_OK;

    } catch (const beardmold::InvalidInputError& e) {
        log->error("{}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return cli::EXIT_INVALID_INPUT;
    } catch (const beardmold::ExportError& e) {
        log->error("{} (statistics: {})", e.what(), e.stats_path());
        std::cerr << "Error: " << e.what() << "\n";
        return cli::EXIT_EXPORT_FAILED;
    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return cli::EXIT_USAGE;
    }
}
