#include <filesystem>
#include <iostream>

#include <abag.hpp>

namespace fs = std::filesystem;

int main(int argc, char *argv[])
{
	if (argc != 2 and argc != 4)
	{
		std::cerr << "Usage: example <inputfile> [<antigen-chains> <antibody-chains>]\n";
		exit(1);
	}

	fs::path file(argv[1]);

	std::error_code ec;
	auto raw = abag::load(file, ec);
	if (ec)
	{
		std::cerr << "Could not read " << file << ": " << ec.message() << '\n';
		exit(1);
	}

	auto s = abag::parse(file.stem().string(), raw, {}, ec);
	if (ec)
	{
		std::cerr << "Could not parse " << file << ": " << ec.message() << '\n';
		exit(1);
	}

	std::cout << "File contains " << s.chains().size() << " chains with " << s.get_residue_count() << " residues\n";

	for (const auto &[id, residue_count] : abag::summarize_chains(s))
		std::cout << id << ' ' << residue_count << '\n';

	if (argc == 4)
	{
		auto assignment = abag::chain_assignment::create(abag::parse_chain_ids(argv[2]), abag::parse_chain_ids(argv[3]), ec);
		if (ec)
		{
			std::cerr << "Invalid chain assignment: " << ec.message() << '\n';
			exit(1);
		}

		auto parts = abag::split(s, assignment, ec);
		if (ec)
		{
			std::cerr << "Missing chain(s): " << abag::join(parts.missing, ",") << '\n';
			exit(1);
		}

		std::cout << "antigen " << parts.antigen.get_residue_count() << " residues, antibody "
				  << parts.antibody.get_residue_count() << " residues\n";

		abag::write(std::cout, parts.antigen, ec);
		if (not ec)
			abag::write(std::cout, parts.antibody, ec);

		if (ec)
		{
			std::cerr << "Could not write: " << ec.message() << '\n';
			exit(1);
		}
	}

	return 0;
}
