#include "plonkish/hash/rescue/rescue_constants.h"

#include <utility>
#include <vector>

namespace plonkish {

/*
  Round constants: element j of vector i is SHA-256("plonkish rescue round constant i j"), read
  as a big-endian integer and reduced modulo the field size.
  MDS matrix: the Cauchy matrix M[i][j] = 1 / (i + j + 4). Every square submatrix of a Cauchy
  matrix is invertible.
*/
const RescueConstants kRescueConstants = {
    // k_round_constants.
    {{
         {BaseFieldElement::FromUint(0x58bad8d73b5b96a),
          BaseFieldElement::FromUint(0xcd66a50aef7eaae),
          BaseFieldElement::FromUint(0x2b73d6b49974e36),
          BaseFieldElement::FromUint(0x1b3fd6d818ec1540)},
         {BaseFieldElement::FromUint(0x536aa9c44312604),
          BaseFieldElement::FromUint(0x135b11b96ac25c6e),
          BaseFieldElement::FromUint(0x412201342b5a88f),
          BaseFieldElement::FromUint(0x26be8226370b2fb)},
         {BaseFieldElement::FromUint(0x15834721161c3d77),
          BaseFieldElement::FromUint(0x85d08019d61308e),
          BaseFieldElement::FromUint(0xe4eb19aa2e9584e),
          BaseFieldElement::FromUint(0x4568183854e8223)},
         {BaseFieldElement::FromUint(0x1f39655818f522e3),
          BaseFieldElement::FromUint(0x7f6887385418eee),
          BaseFieldElement::FromUint(0x92e7adb1df71554),
          BaseFieldElement::FromUint(0x1ee48c4477259c1d)},
         {BaseFieldElement::FromUint(0xe12d616682aa273),
          BaseFieldElement::FromUint(0x17a4d98c8a304d3d),
          BaseFieldElement::FromUint(0xf3295f431e587fc),
          BaseFieldElement::FromUint(0x16820247566f3fbc)},
         {BaseFieldElement::FromUint(0x1cd339c9aa56dc4a),
          BaseFieldElement::FromUint(0x19514b16a6ebc242),
          BaseFieldElement::FromUint(0x7c1449a930264ae),
          BaseFieldElement::FromUint(0x13fa11dd159b6630)},
         {BaseFieldElement::FromUint(0x15abbdc44ac4588d),
          BaseFieldElement::FromUint(0xb007ae6a62169c),
          BaseFieldElement::FromUint(0xfffeaae75551d4e),
          BaseFieldElement::FromUint(0x45f77ec8a0f5f57)},
         {BaseFieldElement::FromUint(0x1c6257db4bad5bc7),
          BaseFieldElement::FromUint(0x1703f91402520454),
          BaseFieldElement::FromUint(0x182d174093e8bc46),
          BaseFieldElement::FromUint(0xb6e0c7e47f0bdca)},
         {BaseFieldElement::FromUint(0x19a91edb94556d49),
          BaseFieldElement::FromUint(0x4390c78182404ce),
          BaseFieldElement::FromUint(0x1ecf4df5174e95ab),
          BaseFieldElement::FromUint(0x1c531bbd3e5f8086)},
         {BaseFieldElement::FromUint(0xef9ecc7b8d401a4),
          BaseFieldElement::FromUint(0xfa4071dd5349c59),
          BaseFieldElement::FromUint(0x329e75f91bd25d2),
          BaseFieldElement::FromUint(0x1de9c1ac7338bdd5)},
         {BaseFieldElement::FromUint(0xf4dd18ee2748034),
          BaseFieldElement::FromUint(0x1769f7ef2b86b6e7),
          BaseFieldElement::FromUint(0xf63db348e250139),
          BaseFieldElement::FromUint(0x1fd68522fe26d64)},
         {BaseFieldElement::FromUint(0x873e3d4035c09c0),
          BaseFieldElement::FromUint(0x114edf8464fb60d3),
          BaseFieldElement::FromUint(0x13283e72e037ac2c),
          BaseFieldElement::FromUint(0x1cbbed147b3d8a29)},
         {BaseFieldElement::FromUint(0x1afed273c29c8e88),
          BaseFieldElement::FromUint(0x1fd53d2d8de1952e),
          BaseFieldElement::FromUint(0x1e9e783003e7e77d),
          BaseFieldElement::FromUint(0x1a7a4da42fcb505d)},
         {BaseFieldElement::FromUint(0x1c0b9fefe71db365),
          BaseFieldElement::FromUint(0xf137b9d252d16a),
          BaseFieldElement::FromUint(0xf4d631c4eac783a),
          BaseFieldElement::FromUint(0x1f692ebb2797b915)},
         {BaseFieldElement::FromUint(0x37ca275ac82fadc),
          BaseFieldElement::FromUint(0x655077367cdd0ee),
          BaseFieldElement::FromUint(0x11e9320f1442f16f),
          BaseFieldElement::FromUint(0x206640c6acb8f01)},
         {BaseFieldElement::FromUint(0x1f91d00400c426c7),
          BaseFieldElement::FromUint(0x13a77685a9686fa),
          BaseFieldElement::FromUint(0x77018b771d9e952),
          BaseFieldElement::FromUint(0xc7d835d425ead6e)},
         {BaseFieldElement::FromUint(0x71eb4797d102577),
          BaseFieldElement::FromUint(0xae9dd31aecb63d3),
          BaseFieldElement::FromUint(0x17c8e7629cb990b0),
          BaseFieldElement::FromUint(0x5f14d6dd9ad2e1c)},
         {BaseFieldElement::FromUint(0x171654c308122c24),
          BaseFieldElement::FromUint(0x179257818e081ace),
          BaseFieldElement::FromUint(0x157c78972cc4c43),
          BaseFieldElement::FromUint(0x56accecaae6e88a)},
         {BaseFieldElement::FromUint(0x62b17de412ad567),
          BaseFieldElement::FromUint(0x1e2826c6e9c3b944),
          BaseFieldElement::FromUint(0x10dd99cdf3fedd0a),
          BaseFieldElement::FromUint(0x14ff90c348c8b010)},
         {BaseFieldElement::FromUint(0xc3cd9027bac746d),
          BaseFieldElement::FromUint(0x24db485ddcf3ea5),
          BaseFieldElement::FromUint(0x80e575326c0f714),
          BaseFieldElement::FromUint(0x178b11ce14859573)},
         {BaseFieldElement::FromUint(0xb3584b327fd61d0),
          BaseFieldElement::FromUint(0xbf27859e03cda7f),
          BaseFieldElement::FromUint(0xf0cb1f23876b453),
          BaseFieldElement::FromUint(0x722862163d5229e)},
    }},
    // k_mds_matrix.
    {{
         {BaseFieldElement::FromUint(0x1800000f00000001),
          BaseFieldElement::FromUint(0x1333333f33333334),
          BaseFieldElement::FromUint(0x5555558aaaaaaab),
          BaseFieldElement::FromUint(0x49249276db6db6e)},
         {BaseFieldElement::FromUint(0x1333333f33333334),
          BaseFieldElement::FromUint(0x5555558aaaaaaab),
          BaseFieldElement::FromUint(0x49249276db6db6e),
          BaseFieldElement::FromUint(0x1c00001180000001)},
         {BaseFieldElement::FromUint(0x5555558aaaaaaab),
          BaseFieldElement::FromUint(0x49249276db6db6e),
          BaseFieldElement::FromUint(0x1c00001180000001),
          BaseFieldElement::FromUint(0xe38e3971c71c71d)},
         {BaseFieldElement::FromUint(0x49249276db6db6e),
          BaseFieldElement::FromUint(0x1c00001180000001),
          BaseFieldElement::FromUint(0xe38e3971c71c71d),
          BaseFieldElement::FromUint(0x999999f9999999a)},
    }},
};

RescueParams DefaultRescueParams() {
  std::vector<RescueParams::VectorT> round_constants;
  for (const auto& round_constants_vector : kRescueConstants.k_round_constants) {
    round_constants.emplace_back(round_constants_vector.begin(), round_constants_vector.end());
  }
  std::vector<RescueParams::VectorT> mds_matrix;
  for (const auto& row : kRescueConstants.k_mds_matrix) {
    mds_matrix.emplace_back(row.begin(), row.end());
  }
  return RescueParams(
      RescueConstants::kRate, RescueConstants::kCapacity, RescueConstants::kNumRounds,
      std::move(round_constants), std::move(mds_matrix), PowerSBox::FifthRoot(), QuinticSBox());
}

}  // namespace plonkish
