// SPDX-License-Identifier: GPL-3.0-or-later
#include "libclient/utils/namegenerator.h"
#include <QRandomGenerator>

namespace utils {

namespace {

constexpr const char *ADJECTIVES[] = {
	"Happy",   "Grumpy",   "Sleepy",  "Cranky",   "Cheerful", "Sneaky",
	"Lazy",	   "Bouncy",   "Giggly",  "Silly",	  "Curious",  "Brave",
	"Shy",	   "Wild",	   "Calm",	  "Fierce",	  "Gentle",	  "Jolly",
	"Merry",   "Witty",	   "Zany",	  "Fuzzy",	  "Fluffy",	  "Sparkly",
	"Shiny",   "Spotted",  "Striped", "Scruffy",  "Chubby",	  "Tiny",
	"Giant",   "Cosmic",   "Golden",  "Silver",	  "Rainbow",  "Swift",
	"Speedy",  "Zippy",	   "Dashing", "Prancing", "Dancing",  "Wobbly",
	"Toasty",  "Frosty",   "Sunny",	  "Breezy",	  "Stormy",	  "Misty",
	"Ninja",   "Pirate",   "Mystic",  "Magic",	  "Electric", "Turbo",
	"Mega",	   "Super",	   "Ultra",	  "Hyper",	  "Pixel",	  "Retro",
	"Neon",
};

constexpr const char *ANIMALS[] = {
	"Panda",	 "Otter",	  "Koala",	   "Fox",		 "Wolf",
	"Bear",		 "Rabbit",	  "Hedgehog",  "Squirrel",	 "Raccoon",
	"Badger",	 "Moose",	  "Alpaca",	   "Llama",		 "Sloth",
	"Wombat",	 "Platypus",  "Kangaroo",  "Dolphin",	 "Whale",
	"Seal",		 "Walrus",	  "Penguin",   "Owl",		 "Eagle",
	"Hawk",		 "Parrot",	  "Toucan",	   "Flamingo",	 "Pelican",
	"Puffin",	 "Peacock",	  "Raven",	   "Sparrow",	 "Turtle",
	"Gecko",	 "Chameleon", "Dragon",	   "Frog",		 "Axolotl",
	"Octopus",	 "Jellyfish", "Seahorse",  "Starfish",	 "Crab",
	"Lobster",	 "Narwhal",	  "Butterfly", "Beetle",	 "Firefly",
	"Ladybug",	 "Bumblebee", "Phoenix",   "Griffin",	 "Unicorn",
	"Kraken",	 "Yeti",	  "Sphinx",
};

constexpr int ADJECTIVE_COUNT = int(sizeof(ADJECTIVES) / sizeof(*ADJECTIVES));
constexpr int ANIMAL_COUNT = int(sizeof(ANIMALS) / sizeof(*ANIMALS));

QString pickName(QRandomGenerator &rng)
{
	int adjective = rng.bounded(ADJECTIVE_COUNT);
	int animal = rng.bounded(ANIMAL_COUNT);
	return QStringLiteral("%1 %2").arg(
		QLatin1String(ADJECTIVES[adjective]), QLatin1String(ANIMALS[animal]));
}

}

QString generateDisplayName()
{
	return pickName(*QRandomGenerator::global());
}

QString generateDisplayName(quint32 seed)
{
	QRandomGenerator rng(seed);
	return pickName(rng);
}

}
