#pragma once

#include <string>

// Reduce a GPU product name to its generation:
//   "NVIDIA A100-SXM4-80GB"   -> "A100"
//   "Tesla V100-SXM2-16GB"    -> "V100"
//   "NVIDIA H100 80GB HBM3"   -> "H100"
//   "AMD Instinct MI300X"     -> "MI300X"
//   "NVIDIA GeForce RTX 4090" -> "RTX4090"
// Slurm GRES types ("h100") come through upper-cased.
std::string normalize_gpu_name(const std::string& raw);

// "amd" for Instinct (MI*) parts, "nvidia" otherwise, "none" for an empty model.
std::string gpu_vendor_for_model(const std::string& model);
