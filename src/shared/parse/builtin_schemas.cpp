/*
 * Copyright (C) 2026 Solaris
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */

#include "parse/builtin_schemas.h"

using namespace solaris::decode;

namespace solaris
{
namespace parse
{
document_schema achievements_schema()
{
    schema_builder b;

    b.record("Rule")
        .i32("ability_title")
        .i32("achievement_point")
        .string("desc")
        .i32("id")
        .i32("spe_name_bonus")
        .string("threshold")
        .string("abtext")
        .string("ach_name")
        .i32("hide")
        .i32("proicon")
        .string("title")
        .string("title_color");

    b.record("Branch")
        .string("desc")
        .i32("id")
        .i32("is_single")
        .array_of("rule", "Rule")
        .string("text")
        .i32("is_show_pro");

    b.record("Branches").array_of("branch", "Branch");

    b.record("Type")
        .array_of("branches", "Branches")
        .string("desc")
        .i32("id");

    b.record("AchievementRules").array_of("type", "Type");

    return b.document("achievements", "achievements.bytes", "achievements.json",
        "achievement_rules", "AchievementRules");
}

document_schema nature_schema()
{
    schema_builder b;

    // Stat modifiers are stored as f32 and published with two decimals
    b.record("Nature")
        .string("des")
        .string("des2")
        .i32("id")
        .f32("sp_atk", 2)
        .f32("sp_def", 2)
        .f32("atk", 2)
        .f32("def", 2)
        .f32("spd", 2)
        .string("name");

    b.record("Root").array_of("nature", "Nature");

    return b.document(
        "nature", "nature.bytes", "nature.json", "root", "Root");
}

document_schema effect_icon_schema()
{
    schema_builder b;

    b.record("Effect")
        .i32("id")
        .string("args")
        .string("come")
        .array("des", field_type::string)
        .i32("effect_id")
        .i32("icon_id")
        .i32("intensify")
        .i32("is_adv")
        .array("kind", field_type::i32)
        .i32("label")
        .i32("limited_type")
        .array("pet_id", field_type::i32)
        .array("specific_id", field_type::i32)
        .array("tag", field_type::string)
        .i32("target")
        .string("tips")
        .i32("to");

    b.record("Root").array_of("effect", "Effect");

    return b.document(
        "effect_icon", "effectIcon.bytes", "effectIcon.json", "root", "Root");
}

document_schema pet_skin_schema()
{
    schema_builder b;

    b.record("SkinKind")
        .i32("id")
        .i32("life_time")
        .i32("skin_type")
        .i32("type")
        .i32("year");

    b.record("Skin")
        .string("go")
        .string("go_type")
        .i32("id")
        .i32("mon_id")
        .string("name")
        .array_of("skin_kind", "SkinKind")
        .i32("type");

    b.record("PetSkins").array_of("skin", "Skin");

    return b.document(
        "pet_skin", "pet_skin.bytes", "petSkin.json", "pet_skins", "PetSkins");
}

document_schema monsters_schema()
{
    schema_builder b;

    b.record("Move").i32("id").i32("learning_lv").i32("rec").i32("tag");

    // The client has both "Tag" and "tag" on these
    b.record("SpMove").i32("id").i32("rec").i32("tag").i32("tag2");

    b.record("LearnableMoves")
        .array_of("adv_move", "SpMove")
        .array_of("move", "Move")
        .array_of("sp_move", "SpMove");

    b.record("Monster")
        .i32("atk")
        .i32("character_attr_param")
        .i32("combo")
        .i32("def")
        .string("def_name")
        .i32("evolv_flag")
        .i32("evolves_to")
        .i32("evolving_lv")
        .record("extra_moves", "LearnableMoves")
        .i32("free_forbidden")
        .i32("gender")
        .i32("hp")
        .i32("id")
        .record("learnable_moves", "LearnableMoves")
        .record("move", "Move")
        .i32("pet_class")
        .i32("real_id")
        .record("show_extra_moves", "LearnableMoves")
        .i32("sp_atk")
        .i32("sp_def")
        .record("sp_extra_moves", "LearnableMoves")
        .i32("spd")
        .i32("support")
        .i32("transform")
        .i32("type")
        .i32("vip")
        .i32("is_fly_pet")
        .i32("is_ride_pet");

    b.record("Monsters").array_of("monster", "Monster");

    return b.document(
        "monsters", "monsters.bytes", "monsters.json", "monsters", "Monsters");
}

document_schema move_stones_schema()
{
    schema_builder b;

    b.record("MoveEffect")
        .i32("id")
        .array("side_effect", field_type::i32, absent_policy::null)
        .array("side_effect_arg", field_type::i32, absent_policy::null);

    b.record("MoveStone")
        .i32("id")
        .i32("max_pp")
        .array_of("move_effect", "MoveEffect")
        .string("name")
        .i32("power")
        .i32("type");

    b.record("MoveStones").array_of("move_stone", "MoveStone");

    // An absent file publishes {"root": null}, not an empty list
    return b.document("move_stones", "move_stones.bytes", "moveStones.json",
        "root", "MoveStones", absent_policy::null);
}

std::vector<document_schema> builtin_schemas()
{
    std::vector<document_schema> schemas;
    schemas.push_back(achievements_schema());
    schemas.push_back(effect_icon_schema());
    schemas.push_back(monsters_schema());
    schemas.push_back(move_stones_schema());
    schemas.push_back(nature_schema());
    schemas.push_back(pet_skin_schema());
    return schemas;
}
}
}
