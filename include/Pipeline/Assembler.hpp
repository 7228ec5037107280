#pragma once

#include <string>
#include <vector>
#include <memory>

#include "BarcodeTable.hpp"
#include "HomologySearch.hpp"
#include "PipelineConfig.hpp"

enum class AssemblyMode
{
    Pooled,
    PerReplicate
};

/// the assembled contigs of one well, tagged "pooled" or with the replicate name
struct ContigSet
{
    Well well;
    std::string modeTag;
    //fasta file holding the contigs (always written, empty if there are none)
    std::string sourceFile;
    std::vector<FastaRecord> contigs;

    bool empty() const { return contigs.empty(); }
};

/// reads of one well and where its contigs belong
struct AssemblyInput
{
    Well well;
    std::string modeTag;
    std::string forwardReads;
    std::string reverseReads;
    //scratch directory of the assembler, removed before the call
    std::string workDir;
    //final contig file
    std::string contigFile;
    std::string logFile;
};

//<cells>/<well>/contigs.fasta for pooled assemblies, <cells>/<well>/<replicate>_contigs.fasta otherwise
std::string contig_file_name(AssemblyMode mode, const std::string& modeTag);

/** @brief capability interface of an assembly engine
 * @details a non-zero exit of the external tool throws an ExternalToolError.
 * Zero contigs, or no contig file after a successful run, is an empty ContigSet.
**/
class Assembler
{
    public:
        virtual ~Assembler() = default;

        ContigSet assemble(const AssemblyInput& input);
        virtual std::string name() const = 0;

    protected:
        //runs the tool and returns the contig file it produced inside workDir
        virtual std::string run_engine(const AssemblyInput& input) = 0;
};
typedef std::unique_ptr<Assembler> AssemblerPtr;

/** @brief megahit -1 <R1> -2 <R2> -o <workDir> <params>, contigs in final.contigs.fa
**/
class MegahitAssembler : public Assembler
{
    public:
        MegahitAssembler(const std::string& executable, const std::string& params)
        : executable(executable), params(splitByWhitespace(params))
        {}
        std::string name() const override { return "megahit"; }

    protected:
        std::string run_engine(const AssemblyInput& input) override;

    private:
        std::string executable;
        std::vector<std::string> params;
};

/** @brief skesa --reads <R1>,<R2> --contigs_out <workDir>/contigs.fa <params>
**/
class SkesaAssembler : public Assembler
{
    public:
        SkesaAssembler(const std::string& executable, const std::string& params)
        : executable(executable), params(splitByWhitespace(params))
        {}
        std::string name() const override { return "skesa"; }

    protected:
        std::string run_engine(const AssemblyInput& input) override;

    private:
        std::string executable;
        std::vector<std::string> params;
};

/** @brief spades -1 <R1> -2 <R2> -o <workDir> <params>, contigs in contigs.fasta
**/
class SpadesAssembler : public Assembler
{
    public:
        SpadesAssembler(const std::string& executable, const std::string& params)
        : executable(executable), params(splitByWhitespace(params))
        {}
        std::string name() const override { return "spades"; }

    protected:
        std::string run_engine(const AssemblyInput& input) override;

    private:
        std::string executable;
        std::vector<std::string> params;
};

//engine selected in the config with its executable and parameters
AssemblerPtr make_assembler(const PipelineConfig& cfg);
